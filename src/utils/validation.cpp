#include "validation.hpp"
#include "libriskscan/core/errors.hpp"
#include <cmath>
#include <stdexcept>

namespace riskscan {

using libriskscan::core::CrossSectionalSpec;
using libriskscan::core::SchemaError;
using libriskscan::core::Table;
using libriskscan::core::TimeSeriesSpec;

size_t ValidationUtils::FindColumnByName(const std::vector<std::string> &column_names, const std::string &col_name) {
	for (size_t i = 0; i < column_names.size(); i++) {
		if (column_names[i] == col_name) {
			return i;
		}
	}
	throw SchemaError("Column '" + col_name + "' not found in table", {col_name});
}

void ValidationUtils::ValidateRequiredColumns(const Table &table, const std::vector<std::string> &col_names,
                                              const std::string &context) {
	table.RequireColumns(col_names, context);
}

void ValidationUtils::ValidateNumericColumn(const Table &table, const std::string &col_name,
                                            const std::string &context) {
	FindColumnByName(table.ColumnNames(), col_name);
	if (!table.GetColumn(col_name).is_numeric()) {
		throw SchemaError(context + ": column '" + col_name + "' must be numeric");
	}
}

void ValidationUtils::ValidateNonEmptyColumnList(const std::vector<std::string> &col_names, const std::string &what) {
	if (col_names.empty()) {
		throw std::invalid_argument(what + " must name at least one column");
	}
}

size_t ValidationUtils::CountNonFinite(const Eigen::VectorXd &values) {
	size_t count = 0;
	for (Eigen::Index i = 0; i < values.size(); i++) {
		if (!std::isfinite(values(i))) {
			count++;
		}
	}
	return count;
}

std::vector<std::string> ValidationUtils::ValidateCrossSectionalInput(const Table &table,
                                                                      const CrossSectionalSpec &spec) {
	const auto watched = spec.WatchedColumns();
	ValidateNonEmptyColumnList(watched, spec.category + " watched fields");
	ValidateRequiredColumns(table, spec.RequiredColumns(), spec.category);

	ValidateNumericColumn(table, spec.magnitude_column, spec.category);

	std::vector<std::string> with_gaps;
	for (const auto &col : watched) {
		ValidateNumericColumn(table, col, spec.category);
		if (HasNonFiniteValues(table.NumericColumn(col))) {
			with_gaps.push_back(col);
		}
	}
	return with_gaps;
}

std::vector<std::string> ValidationUtils::ValidateTimeSeriesInput(const Table &table, const TimeSeriesSpec &spec) {
	ValidateNonEmptyColumnList(spec.metrics, spec.category + " metrics");
	ValidateRequiredColumns(table, {spec.period_column}, spec.category);

	std::vector<std::string> absent;
	for (const auto &metric : spec.metrics) {
		if (!table.HasColumn(metric)) {
			absent.push_back(metric);
			continue;
		}
		ValidateNumericColumn(table, metric, spec.category);
	}
	return absent;
}

} // namespace riskscan
