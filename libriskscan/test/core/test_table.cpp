#include <catch2/catch.hpp>

#include <libriskscan/core/errors.hpp>
#include <libriskscan/core/table.hpp>
#include <Eigen/Dense>
#include <cmath>
#include <limits>

using namespace libriskscan::core;

namespace {

Table MakeLedger() {
	return Table({Column::Numeric("cost_id", std::vector<double> {1, 2, 3, 4}),
	              Column::Text("business_unit", {"Retail", "Treasury", "Retail", "Operations"}),
	              Column::Numeric("actual_amount", std::vector<double> {100.0, 250.5, 80.0, 100.0})});
}

} // namespace

TEST_CASE("Table: construction", "[core][table]") {
	SECTION("Row and column counts") {
		Table t = MakeLedger();
		REQUIRE(t.RowCount() == 4);
		REQUIRE(t.ColumnCount() == 3);
		REQUIRE_FALSE(t.Empty());
		REQUIRE(t.ColumnNames() == std::vector<std::string> {"cost_id", "business_unit", "actual_amount"});
	}

	SECTION("Default table has no rows") {
		Table t;
		REQUIRE(t.RowCount() == 0);
		REQUIRE(t.ColumnCount() == 0);
		REQUIRE(t.Empty());
	}

	SECTION("Columns of different lengths are rejected") {
		REQUIRE_THROWS_AS(Table({Column::Numeric("a", std::vector<double> {1, 2}),
		                         Column::Numeric("b", std::vector<double> {1})}),
		                  std::invalid_argument);
	}

	SECTION("Duplicate names are rejected") {
		REQUIRE_THROWS_AS(Table({Column::Numeric("a", std::vector<double> {1}),
		                         Column::Text("a", {"x"})}),
		                  std::invalid_argument);
	}
}

TEST_CASE("Table: column lookup", "[core][table]") {
	Table t = MakeLedger();

	SECTION("Existing columns") {
		REQUIRE(t.HasColumn("business_unit"));
		REQUIRE(t.GetColumn("business_unit").text[1] == "Treasury");
		REQUIRE(t.NumericColumn("actual_amount")(1) == 250.5);
	}

	SECTION("Missing column raises a schema error") {
		REQUIRE_FALSE(t.HasColumn("vendor"));
		REQUIRE_THROWS_AS(t.GetColumn("vendor"), SchemaError);
	}

	SECTION("Text column is not numeric") {
		REQUIRE_THROWS_AS(t.NumericColumn("business_unit"), SchemaError);
	}

	SECTION("Schema error is an invalid_argument") {
		REQUIRE_THROWS_AS(t.GetColumn("vendor"), std::invalid_argument);
	}
}

TEST_CASE("Table: required columns", "[core][table]") {
	Table t = MakeLedger();

	SECTION("All present") {
		REQUIRE(t.MissingColumns({"cost_id", "actual_amount"}).empty());
		REQUIRE_NOTHROW(t.RequireColumns({"cost_id", "actual_amount"}, "Costs"));
	}

	SECTION("Missing columns are listed in order, once") {
		auto missing = t.MissingColumns({"variance_pct", "cost_id", "budget_amount", "variance_pct"});
		REQUIRE(missing == std::vector<std::string> {"variance_pct", "budget_amount"});
	}

	SECTION("Error names the dataset and every missing column") {
		try {
			t.RequireColumns({"variance_pct", "budget_amount"}, "Costs");
			FAIL("expected SchemaError");
		} catch (const SchemaError &e) {
			REQUIRE(std::string(e.what()) == "Costs missing required columns: variance_pct, budget_amount");
			REQUIRE(e.MissingColumns() == std::vector<std::string> {"variance_pct", "budget_amount"});
		}
	}

	SECTION("A table without columns misses everything") {
		Table empty;
		REQUIRE_THROWS_AS(empty.RequireColumns({"cost_id"}, "Costs"), SchemaError);
	}
}

TEST_CASE("Table: copies never modify the source", "[core][table]") {
	Table t = MakeLedger();
	const Table original = t;

	SECTION("WithColumn appends") {
		Table extended = t.WithColumn(Column::Numeric("flag", std::vector<double> {0, 1, 0, 1}));
		REQUIRE(extended.ColumnCount() == 4);
		REQUIRE(extended.ColumnNames().back() == "flag");
		REQUIRE(t == original);
	}

	SECTION("WithColumn replaces a column of the same name in place") {
		Table replaced = t.WithColumn(Column::Text("cost_id", {"a", "b", "c", "d"}));
		REQUIRE(replaced.ColumnCount() == 3);
		REQUIRE(replaced.ColumnNames().front() == "cost_id");
		REQUIRE_FALSE(replaced.GetColumn("cost_id").is_numeric());
		REQUIRE(t == original);
	}

	SECTION("WithColumn rejects a wrong length") {
		REQUIRE_THROWS_AS(t.WithColumn(Column::Numeric("flag", std::vector<double> {0, 1})), std::invalid_argument);
	}
}

TEST_CASE("Table: row selection", "[core][table]") {
	Table t = MakeLedger();

	SECTION("SelectRows keeps the given order") {
		Table picked = t.SelectRows({3, 0});
		REQUIRE(picked.RowCount() == 2);
		REQUIRE(picked.GetColumn("business_unit").text == std::vector<std::string> {"Operations", "Retail"});
		REQUIRE(picked.NumericColumn("cost_id")(0) == 4.0);
	}

	SECTION("Selecting no rows keeps the columns") {
		Table none = t.SelectRows({});
		REQUIRE(none.RowCount() == 0);
		REQUIRE(none.ColumnNames() == t.ColumnNames());
		REQUIRE(none.GetColumn("cost_id").is_numeric());
	}

	SECTION("Out-of-range rows are rejected") {
		REQUIRE_THROWS_AS(t.SelectRows({4}), std::out_of_range);
	}

	SECTION("Head") {
		REQUIRE(t.Head(2).RowCount() == 2);
		REQUIRE(t.Head(10).RowCount() == 4);
		REQUIRE(t.Head(0).RowCount() == 0);
	}

	SECTION("Project") {
		Table p = t.Project({"actual_amount", "cost_id"});
		REQUIRE(p.ColumnNames() == std::vector<std::string> {"actual_amount", "cost_id"});
		REQUIRE_THROWS_AS(t.Project({"vendor"}), SchemaError);
	}
}

TEST_CASE("Table: stable ordering", "[core][table]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	Table t({Column::Numeric("key", std::vector<double> {2.0, nan, 1.0, 2.0, 0.5}),
	         Column::Text("label", {"first two", "missing", "one", "second two", "half"})});

	SECTION("Ascending, NaN last, ties keep input order") {
		REQUIRE(t.StableOrder("key") == std::vector<size_t> {4, 2, 0, 3, 1});
	}

	SECTION("Descending, NaN still last, ties keep input order") {
		REQUIRE(t.StableOrder("key", false) == std::vector<size_t> {0, 3, 2, 4, 1});
	}

	SECTION("Text keys sort lexicographically") {
		Table months({Column::Text("month", {"2024-03", "2023-12", "2024-01"})});
		Table sorted = months.StableSortedBy("month");
		REQUIRE(sorted.GetColumn("month").text == std::vector<std::string> {"2023-12", "2024-01", "2024-03"});
	}
}

TEST_CASE("Table: concatenation", "[core][table]") {
	Table a({Column::Text("id", {"a"}), Column::Numeric("v", std::vector<double> {1.0})});
	Table b({Column::Text("id", {"b", "c"}), Column::Numeric("v", std::vector<double> {2.0, 3.0})});

	SECTION("Stacks rows in order") {
		Table c = Table::Concat({a, b});
		REQUIRE(c.RowCount() == 3);
		REQUIRE(c.GetColumn("id").text == std::vector<std::string> {"a", "b", "c"});
		REQUIRE(c.NumericColumn("v")(2) == 3.0);
	}

	SECTION("Tables without columns are skipped") {
		Table c = Table::Concat({Table(), a, Table()});
		REQUIRE(c == a);
		REQUIRE(Table::Concat({}).ColumnCount() == 0);
	}

	SECTION("Schema mismatch is rejected") {
		Table other({Column::Text("id", {"x"}), Column::Text("v", {"y"})});
		REQUIRE_THROWS_AS(Table::Concat({a, other}), std::invalid_argument);
	}
}

TEST_CASE("Table: cell formatting", "[core][table]") {
	SECTION("Integral values print without fraction") {
		REQUIRE(FormatNumber(42.0) == "42");
		REQUIRE(FormatNumber(-7.0) == "-7");
		REQUIRE(FormatNumber(0.0) == "0");
	}

	SECTION("Fractions and missing values") {
		REQUIRE(FormatNumber(0.25) == "0.25");
		REQUIRE(FormatNumber(std::numeric_limits<double>::quiet_NaN()).empty());
	}

	SECTION("FormatCell uses the column type") {
		Table t = MakeLedger();
		REQUIRE(t.FormatCell("cost_id", 2) == "3");
		REQUIRE(t.FormatCell("business_unit", 2) == "Retail");
		REQUIRE(t.FormatCell("actual_amount", 1) == "250.5");
		REQUIRE_THROWS_AS(t.FormatCell("cost_id", 9), std::out_of_range);
	}
}

TEST_CASE("Table: equality treats missing values as equal", "[core][table]") {
	const double nan = std::numeric_limits<double>::quiet_NaN();
	Table a({Column::Numeric("v", std::vector<double> {1.0, nan})});
	Table b({Column::Numeric("v", std::vector<double> {1.0, nan})});
	Table c({Column::Numeric("v", std::vector<double> {1.0, 2.0})});
	REQUIRE(a == b);
	REQUIRE(a != c);
}
