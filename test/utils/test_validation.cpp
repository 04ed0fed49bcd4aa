#include <catch2/catch.hpp>

#include "utils/validation.hpp"
#include <libriskscan/core/errors.hpp>
#include <cmath>
#include <limits>

using namespace riskscan;
using namespace libriskscan::core;

namespace {

Table Loans() {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	return Table({Column::Numeric("loan_id", std::vector<double> {1, 2, 3}),
	              Column::Text("loan_type", {"Auto", "Mortgage", "Auto"}),
	              Column::Numeric("pd", std::vector<double> {0.02, nan, 0.03}),
	              Column::Numeric("ecl", std::vector<double> {10.0, 20.0, 30.0}),
	              Column::Numeric("ead", std::vector<double> {1000.0, std::numeric_limits<double>::infinity(), 900.0})});
}

} // namespace

TEST_CASE("ValidationUtils: column lookup", "[utils][validation]") {
	std::vector<std::string> names = {"month", "profit", "total_revenue"};

	REQUIRE(ValidationUtils::FindColumnByName(names, "month") == 0);
	REQUIRE(ValidationUtils::FindColumnByName(names, "total_revenue") == 2);
	REQUIRE_THROWS_AS(ValidationUtils::FindColumnByName(names, "ecl"), SchemaError);
}

TEST_CASE("ValidationUtils: column checks", "[utils][validation]") {
	Table loans = Loans();

	SECTION("Required columns") {
		REQUIRE_NOTHROW(ValidationUtils::ValidateRequiredColumns(loans, {"loan_id", "pd"}, "Loans"));
		REQUIRE_THROWS_AS(ValidationUtils::ValidateRequiredColumns(loans, {"lgd"}, "Loans"), SchemaError);
	}

	SECTION("Numeric columns") {
		REQUIRE_NOTHROW(ValidationUtils::ValidateNumericColumn(loans, "pd", "Loans"));
		REQUIRE_THROWS_AS(ValidationUtils::ValidateNumericColumn(loans, "loan_type", "Loans"), SchemaError);
		REQUIRE_THROWS_AS(ValidationUtils::ValidateNumericColumn(loans, "lgd", "Loans"), SchemaError);
	}

	SECTION("Non-empty column lists") {
		REQUIRE_THROWS_AS(ValidationUtils::ValidateNonEmptyColumnList({}, "Loans watched fields"),
		                  std::invalid_argument);
		REQUIRE_NOTHROW(ValidationUtils::ValidateNonEmptyColumnList({"pd"}, "Loans watched fields"));
	}

	SECTION("Non-finite values") {
		REQUIRE(ValidationUtils::CountNonFinite(loans.NumericColumn("pd")) == 1);
		REQUIRE(ValidationUtils::HasNonFiniteValues(loans.NumericColumn("ead")));
		REQUIRE_FALSE(ValidationUtils::HasNonFiniteValues(loans.NumericColumn("ecl")));
	}
}

TEST_CASE("ValidationUtils: category input", "[utils][validation]") {
	SECTION("Cross-sectional input reports watched columns with gaps") {
		auto gaps = ValidationUtils::ValidateCrossSectionalInput(Loans(), CrossSectionalSpec::Loans());
		REQUIRE(gaps == std::vector<std::string> {"pd", "ead"});
	}

	SECTION("Cross-sectional input needs every watched column") {
		Table no_pd = Loans().Project({"loan_id", "loan_type", "ecl", "ead"});
		REQUIRE_THROWS_AS(ValidationUtils::ValidateCrossSectionalInput(no_pd, CrossSectionalSpec::Loans()),
		                  SchemaError);
	}

	SECTION("Time-series input reports absent metrics") {
		Table kpis({Column::Text("month", {"2024-01", "2024-02"}),
		            Column::Numeric("profit", std::vector<double> {1.0, 2.0})});
		auto absent = ValidationUtils::ValidateTimeSeriesInput(kpis, TimeSeriesSpec::MonthlyKpis());
		REQUIRE(absent == std::vector<std::string> {"total_revenue", "actual_amount", "variance_pct"});
	}

	SECTION("Time-series input needs the period column and numeric metrics") {
		Table no_month({Column::Numeric("profit", std::vector<double> {1.0})});
		REQUIRE_THROWS_AS(ValidationUtils::ValidateTimeSeriesInput(no_month, TimeSeriesSpec::MonthlyKpis()),
		                  SchemaError);

		Table text_metric({Column::Text("month", {"2024-01"}), Column::Text("profit", {"n/a"})});
		REQUIRE_THROWS_AS(ValidationUtils::ValidateTimeSeriesInput(text_metric, TimeSeriesSpec::MonthlyKpis()),
		                  SchemaError);
	}
}
