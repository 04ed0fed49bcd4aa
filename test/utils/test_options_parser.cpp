#include <catch2/catch.hpp>

#include "utils/options_parser.hpp"

using namespace riskscan;
using libriskscan::core::DetectionOptions;
using Catch::Matchers::WithinAbs;
using nlohmann::json;

namespace {

std::string DataFile(const std::string &name) {
	return std::string(RISKSCAN_TEST_DATA_DIR) + "/" + name;
}

/// Message of the std::invalid_argument thrown for a config, or "" if none
std::string RejectionMessage(const json &config) {
	try {
		ParseDetectionOptions(config);
	} catch (const std::invalid_argument &e) {
		return e.what();
	}
	return "";
}

} // namespace

TEST_CASE("Options parser: defaults", "[utils][options]") {
	SECTION("null and empty object give the defaults") {
		for (const json &config : {json(), json::object()}) {
			DetectionOptions opts = ParseDetectionOptions(config);
			REQUIRE(opts.threshold == 3.0);
			REQUIRE(opts.window_cap == 3);
			REQUIRE(opts.top_n == 10);
			REQUIRE(opts.costs.id_column == "cost_id");
			REQUIRE(opts.loans.WatchedColumns() == std::vector<std::string> {"pd", "ecl", "ead"});
			REQUIRE(opts.kpis.metrics ==
			        std::vector<std::string> {"total_revenue", "actual_amount", "profit", "variance_pct"});
		}
	}

	SECTION("Defaults serialize with every key") {
		json out = DetectionOptionsToJson(DetectionOptions::Defaults());
		REQUIRE(out["threshold"] == 3.0);
		REQUIRE(out["window_cap"] == 3);
		REQUIRE(out["costs"]["watched_fields"][0]["score_column"] == "variance_z_score");
		REQUIRE(out["loans"]["magnitude_column"] == "ecl");
		REQUIRE(out["kpis"]["period_column"] == "month");
	}
}

TEST_CASE("Options parser: overrides", "[utils][options]") {
	SECTION("Scalars") {
		DetectionOptions opts = ParseDetectionOptions({{"threshold", 2.5}, {"window_cap", 6}, {"top_n", 4}});
		REQUIRE_THAT(opts.threshold, WithinAbs(2.5, 1e-12));
		REQUIRE(opts.window_cap == 6);
		REQUIRE(opts.top_n == 4);
	}

	SECTION("Integer threshold is accepted") {
		REQUIRE(ParseDetectionOptions({{"threshold", 2}}).threshold == 2.0);
	}

	SECTION("A category object overrides only the keys it names") {
		DetectionOptions opts = ParseDetectionOptions({{"loans", {{"group_column", "region"}}}});
		REQUIRE(opts.loans.group_column == "region");
		REQUIRE(opts.loans.id_column == "loan_id");
		REQUIRE(opts.loans.WatchedColumns() == std::vector<std::string> {"pd", "ecl", "ead"});
		REQUIRE(opts.costs.group_column == "business_unit");
	}

	SECTION("Watched fields replace the default list") {
		json config = {{"costs",
		                {{"watched_fields",
		                  {{{"column", "actual_amount"}, {"label", "High Amount"}},
		                   {{"column", "variance_pct"}, {"label", "High Variance"}, {"score_column", "vz"}}}}}}};
		DetectionOptions opts = ParseDetectionOptions(config);
		REQUIRE(opts.costs.watched_fields.size() == 2);
		REQUIRE(opts.costs.watched_fields[0].column == "actual_amount");
		REQUIRE(opts.costs.watched_fields[0].score_column == "actual_amount_z_score");
		REQUIRE(opts.costs.watched_fields[1].score_column == "vz");
	}

	SECTION("Configuration round-trips through JSON") {
		DetectionOptions opts =
		    ParseDetectionOptions({{"threshold", 1.5}, {"kpis", {{"metrics", {"profit", "variance_pct"}}}}});
		DetectionOptions again = ParseDetectionOptions(DetectionOptionsToJson(opts));
		REQUIRE(again.threshold == 1.5);
		REQUIRE(again.kpis.metrics == std::vector<std::string> {"profit", "variance_pct"});
		REQUIRE(DetectionOptionsToJson(again) == DetectionOptionsToJson(opts));
	}
}

TEST_CASE("Options parser: rejected configurations", "[utils][options]") {
	SECTION("Unknown keys list the valid ones") {
		std::string msg = RejectionMessage({{"thresold", 2.0}});
		REQUIRE(msg.find("Unknown option: 'thresold'") != std::string::npos);
		REQUIRE(msg.find("threshold, window_cap, top_n") != std::string::npos);

		msg = RejectionMessage({{"kpis", {{"period", "month"}}}});
		REQUIRE(msg.find("'kpis.period'") != std::string::npos);
	}

	SECTION("Wrong value types") {
		REQUIRE(RejectionMessage({{"threshold", "3"}}) == "Option 'threshold' must be a number");
		REQUIRE(RejectionMessage({{"costs", "cost_id"}}) == "Option 'costs' must be a JSON object");
		REQUIRE(RejectionMessage({{"kpis", {{"metrics", "profit"}}}}) == "Option 'kpis.metrics' must be an array");
		REQUIRE(RejectionMessage({{"kpis", {{"metrics", {1, 2}}}}}) == "Option 'kpis.metrics[0]' must be a string");
		REQUIRE_FALSE(RejectionMessage(json::array()).empty());
	}

	SECTION("Counts must be non-negative integers") {
		REQUIRE(RejectionMessage({{"window_cap", -1}}) == "Option 'window_cap' must be a non-negative integer");
		REQUIRE(RejectionMessage({{"window_cap", 2.5}}) == "Option 'window_cap' must be a non-negative integer");
		REQUIRE(RejectionMessage({{"top_n", true}}) == "Option 'top_n' must be a non-negative integer");
	}

	SECTION("Values rejected by validation") {
		REQUIRE_FALSE(RejectionMessage({{"threshold", 0}}).empty());
		REQUIRE_FALSE(RejectionMessage({{"threshold", -1.0}}).empty());
		REQUIRE_FALSE(RejectionMessage({{"window_cap", 1}}).empty());
		REQUIRE_FALSE(RejectionMessage({{"top_n", 0}}).empty());
		REQUIRE_FALSE(RejectionMessage({{"loans", {{"watched_fields", json::array()}}}}).empty());
		REQUIRE_FALSE(RejectionMessage({{"kpis", {{"metrics", {"profit", "profit"}}}}}).empty());

		json clobbering = {{"costs",
		                    {{"watched_fields",
		                      {{{"column", "variance_pct"}, {"label", "High Variance"}, {"score_column", "cost_id"}}}}}}};
		REQUIRE(RejectionMessage(clobbering).find("would overwrite input column 'cost_id'") != std::string::npos);
	}

	SECTION("Watched fields need a column and a label") {
		REQUIRE(RejectionMessage({{"costs", {{"watched_fields", {{{"label", "X"}}}}}}}) ==
		        "Option 'costs.watched_fields[0].column' is required");
		REQUIRE(RejectionMessage({{"costs", {{"watched_fields", {{{"column", "x"}}}}}}}) ==
		        "Option 'costs.watched_fields[0].label' is required");
	}
}

TEST_CASE("Options parser: text and files", "[utils][options]") {
	SECTION("Text") {
		REQUIRE(ParseDetectionOptionsText(R"({"top_n": 3})").top_n == 3);
		REQUIRE_THROWS_AS(ParseDetectionOptionsText("{\"top_n\": "), std::invalid_argument);
		REQUIRE_THROWS_AS(ParseDetectionOptionsText(""), std::invalid_argument);
	}

	SECTION("Fixture configuration file") {
		DetectionOptions opts = LoadDetectionOptions(DataFile("config.json"));
		REQUIRE_THAT(opts.threshold, WithinAbs(1.1, 1e-12));
		REQUIRE(opts.top_n == 1);
		REQUIRE(opts.window_cap == 3);
		REQUIRE(opts.kpis.metrics == std::vector<std::string> {"total_revenue", "profit", "net_margin"});
		REQUIRE(opts.costs.category == "Costs");
	}

	SECTION("Missing file") {
		REQUIRE_THROWS_AS(LoadDetectionOptions(DataFile("no_such_config.json")), std::runtime_error);
	}

	SECTION("Invalid content is reported with the path") {
		try {
			LoadDetectionOptions(DataFile("costs.csv"));
			FAIL("expected std::invalid_argument");
		} catch (const std::invalid_argument &e) {
			REQUIRE(std::string(e.what()).find("costs.csv: Invalid configuration JSON") != std::string::npos);
		}
	}
}
