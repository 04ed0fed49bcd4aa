#include <catch2/catch.hpp>

#include "bridge/report_serializer.hpp"
#include <limits>

using namespace riskscan::bridge;
using namespace libriskscan::core;
using namespace libriskscan::report;
using Catch::Matchers::WithinAbs;
using json = ReportSerializer::json;

namespace {

std::vector<std::string> Keys(const json &object) {
	std::vector<std::string> keys;
	for (auto it = object.begin(); it != object.end(); ++it) {
		keys.push_back(it.key());
	}
	return keys;
}

AnomalyReport SampleReport() {
	AnomalyReport report;
	report.summary = {{"Costs", 1, "Corporate Banking", 4.231703927389917, 4869.9}};
	report.cost_anomalies = Table({Column::Numeric("cost_id", std::vector<double> {7}),
	                               Column::Text("business_unit", {"Corporate Banking"}),
	                               Column::Text("anomaly_type", {"High Variance"}),
	                               Column::Numeric("severity", std::vector<double> {4.231703927389917})});
	report.combined = Table({Column::Text("record_id", {"7"}), Column::Text("group", {"Corporate Banking"}),
	                         Column::Text("anomaly_type", {"High Variance"}),
	                         Column::Numeric("severity", std::vector<double> {4.231703927389917}),
	                         Column::Text("category", {"Cost"})});
	report.failures = {{"Loans", "Loans missing required columns: pd"}};
	return report;
}

} // namespace

TEST_CASE("ReportSerializer: tables", "[bridge][json]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	Table t({Column::Text("month", {"2024-09", "2024-10"}), Column::Numeric("value", std::vector<double> {1.5, nan}),
	         Column::Numeric("rolling_z_score", std::vector<double> {std::numeric_limits<double>::infinity(), -0.5})});

	json rows = ReportSerializer::TableToJson(t);
	REQUIRE(rows.is_array());
	REQUIRE(rows.size() == 2);

	SECTION("Keys follow the column order") {
		REQUIRE(Keys(rows[0]) == std::vector<std::string> {"month", "value", "rolling_z_score"});
	}

	SECTION("Text, numbers, and non-finite values as null") {
		REQUIRE(rows[0]["month"] == "2024-09");
		REQUIRE(rows[0]["value"] == 1.5);
		REQUIRE(rows[0]["rolling_z_score"].is_null());
		REQUIRE(rows[1]["value"].is_null());
		REQUIRE(rows[1]["rolling_z_score"] == -0.5);
	}

	SECTION("Empty table") {
		REQUIRE(ReportSerializer::TableToJson(Table()) == json::array());
		REQUIRE(ReportSerializer::TableToJson(t.SelectRows({})) == json::array());
	}
}

TEST_CASE("ReportSerializer: reports", "[bridge][json]") {
	SECTION("Empty report") {
		REQUIRE(ReportSerializer::Serialize(AnomalyReport(), -1) ==
		        R"({"summary":[],"cost_anomalies":[],"loan_anomalies":[],"kpi_anomalies":[],"combined":[],)"
		        R"("failures":[],"total_anomalies":0,"partial":false})");
	}

	SECTION("Sections and summary rows") {
		json doc = ReportSerializer::ReportToJson(SampleReport());
		REQUIRE(Keys(doc) == std::vector<std::string> {"summary", "cost_anomalies", "loan_anomalies", "kpi_anomalies",
		                                               "combined", "failures", "total_anomalies", "partial"});
		REQUIRE(Keys(doc["summary"][0]) == std::vector<std::string> {"category", "anomaly_count", "top_issue",
		                                                            "max_severity", "aggregate_magnitude"});
		REQUIRE(doc["summary"][0]["anomaly_count"] == 1);
		REQUIRE_THAT(doc["summary"][0]["max_severity"].get<double>(), WithinAbs(4.231703927389917, 1e-15));
		REQUIRE(doc["cost_anomalies"][0]["cost_id"] == 7.0);
		REQUIRE(doc["combined"][0]["record_id"] == "7");
		REQUIRE(doc["combined"][0]["category"] == "Cost");
		REQUIRE(doc["failures"][0]["category"] == "Loans");
		REQUIRE(doc["total_anomalies"] == 1);
		REQUIRE(doc["partial"] == true);
	}

	SECTION("Text parses back to the same document") {
		const std::string text = ReportSerializer::Serialize(SampleReport());
		REQUIRE(json::parse(text) == ReportSerializer::ReportToJson(SampleReport()));
		REQUIRE(text.find("\n  \"summary\"") != std::string::npos);
	}

	SECTION("Same report, same text") {
		REQUIRE(ReportSerializer::Serialize(SampleReport()) == ReportSerializer::Serialize(SampleReport()));
	}
}
