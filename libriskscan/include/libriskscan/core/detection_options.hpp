#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace libriskscan {
namespace core {

/**
 * One numeric field watched by the cross-sectional detector
 *
 * `label` becomes the record's anomaly_type when this field is the first one
 * (in declaration order) to exceed the threshold.
 */
struct WatchedField {
	std::string column;
	std::string label;
	std::string score_column;

	/// Build a field; an empty score column defaults to "<column>_z_score"
	static WatchedField Make(std::string column_, std::string label_, std::string score_column_ = "") {
		WatchedField field;
		field.score_column = score_column_.empty() ? column_ + "_z_score" : std::move(score_column_);
		field.column = std::move(column_);
		field.label = std::move(label_);
		return field;
	}
};

/**
 * Per-category settings for cross-sectional detection
 *
 * The order of `watched_fields` is the labeling priority: a record is labeled
 * for the earliest field whose |score| exceeds the threshold, even when a
 * later field deviates more.
 */
struct CrossSectionalSpec {
	/// Summary row name, e.g. "Costs"
	std::string category;

	/// Tag used in the combined findings table, e.g. "Cost"
	std::string tag;

	/// Primary key column (carried unchanged into results)
	std::string id_column;

	/// Grouping dimension reported as the summary's top issue
	std::string group_column;

	/// Column summed into the summary's aggregate magnitude
	std::string magnitude_column;

	std::vector<WatchedField> watched_fields;

	std::vector<std::string> WatchedColumns() const {
		std::vector<std::string> cols;
		cols.reserve(watched_fields.size());
		for (const auto &field : watched_fields) {
			cols.push_back(field.column);
		}
		return cols;
	}

	/// Watched columns plus the id, group and magnitude columns
	std::vector<std::string> RequiredColumns() const {
		std::vector<std::string> cols = {id_column, group_column, magnitude_column};
		for (const auto &field : watched_fields) {
			cols.push_back(field.column);
		}
		return cols;
	}

	/// Cost ledger: variance_pct before actual_amount
	static CrossSectionalSpec Costs() {
		CrossSectionalSpec spec;
		spec.category = "Costs";
		spec.tag = "Cost";
		spec.id_column = "cost_id";
		spec.group_column = "business_unit";
		spec.magnitude_column = "variance_amount";
		spec.watched_fields = {WatchedField::Make("variance_pct", "High Variance", "variance_z_score"),
		                       WatchedField::Make("actual_amount", "High Amount", "actual_z_score")};
		return spec;
	}

	/// Loan portfolio: pd before ecl before ead
	static CrossSectionalSpec Loans() {
		CrossSectionalSpec spec;
		spec.category = "Loans";
		spec.tag = "Loan";
		spec.id_column = "loan_id";
		spec.group_column = "loan_type";
		spec.magnitude_column = "ecl";
		spec.watched_fields = {WatchedField::Make("pd", "High PD"), WatchedField::Make("ecl", "High ECL"),
		                       WatchedField::Make("ead", "High EAD")};
		return spec;
	}

	/**
	 * Check the category definition is usable
	 *
	 * @throws std::invalid_argument if names are empty, watched fields repeat or
	 *         a score column would overwrite an input column
	 */
	void Validate() const {
		if (category.empty()) {
			throw std::invalid_argument("category name must not be empty");
		}
		if (watched_fields.empty()) {
			throw std::invalid_argument(category + ": at least one watched field is required");
		}
		for (size_t i = 0; i < watched_fields.size(); i++) {
			const auto &field = watched_fields[i];
			if (field.column.empty() || field.label.empty() || field.score_column.empty()) {
				throw std::invalid_argument(category + ": watched field " + std::to_string(i) +
				                            " needs a column, a label and a score column");
			}
			for (size_t j = 0; j < i; j++) {
				if (watched_fields[j].column == field.column) {
					throw std::invalid_argument(category + ": field '" + field.column + "' is watched twice");
				}
				if (watched_fields[j].score_column == field.score_column) {
					throw std::invalid_argument(category + ": score column '" + field.score_column +
					                            "' is used twice");
				}
			}
		}
		for (const auto &field : watched_fields) {
			for (const auto &col : RequiredColumns()) {
				if (field.score_column == col) {
					throw std::invalid_argument(category + ": score column '" + field.score_column +
					                            "' would overwrite input column '" + col + "'");
				}
			}
		}
	}
};

/**
 * Settings for the monthly KPI time-series detection
 */
struct TimeSeriesSpec {
	std::string category = "KPIs";

	/// Period key column; ISO "YYYY-MM" text or a numeric index
	std::string period_column = "month";

	/// Metric columns checked one by one, in this order
	std::vector<std::string> metrics;

	static TimeSeriesSpec MonthlyKpis() {
		TimeSeriesSpec spec;
		spec.metrics = {"total_revenue", "actual_amount", "profit", "variance_pct"};
		return spec;
	}

	void Validate() const {
		if (period_column.empty()) {
			throw std::invalid_argument(category + ": period column must not be empty");
		}
		if (metrics.empty()) {
			throw std::invalid_argument(category + ": at least one metric is required");
		}
		for (size_t i = 0; i < metrics.size(); i++) {
			if (metrics[i].empty()) {
				throw std::invalid_argument(category + ": metric " + std::to_string(i) + " has an empty name");
			}
			if (metrics[i] == period_column) {
				throw std::invalid_argument(category + ": metric '" + metrics[i] + "' is the period column");
			}
			for (size_t j = 0; j < i; j++) {
				if (metrics[j] == metrics[i]) {
					throw std::invalid_argument(category + ": metric '" + metrics[i] + "' is listed twice");
				}
			}
		}
	}
};

/**
 * Configuration for a detection run
 *
 * Replaces module-level constants so every run (and every test) can pass its
 * own thresholds and field lists. All defaults are specified in-class.
 */
struct DetectionOptions {
	// ========================================================================
	// Thresholds
	// ========================================================================

	/// Smallest window with a sample deviation
	static constexpr size_t MIN_WINDOW = 2;

	/// |score| must be strictly greater than this to flag a record or point
	/// Default: 3.0 (three standard deviations)
	double threshold = 3.0;

	/// Upper bound of the trailing rolling window
	/// Effective window is min(window_cap, n - 1)
	/// Default: 3
	size_t window_cap = 3;

	// ========================================================================
	// Reporting
	// ========================================================================

	/// Rows taken from each category into the combined findings table
	/// Default: 10
	size_t top_n = 10;

	// ========================================================================
	// Category definitions
	// ========================================================================

	CrossSectionalSpec costs = CrossSectionalSpec::Costs();
	CrossSectionalSpec loans = CrossSectionalSpec::Loans();
	TimeSeriesSpec kpis = TimeSeriesSpec::MonthlyKpis();

	DetectionOptions() = default;

	static DetectionOptions Defaults() {
		return DetectionOptions();
	}

	/// Defaults with a different threshold
	static DetectionOptions WithThreshold(double threshold_) {
		DetectionOptions opts;
		opts.threshold = threshold_;
		return opts;
	}

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (!std::isfinite(threshold) || threshold <= 0.0) {
			throw std::invalid_argument("threshold must be a positive number (got " + std::to_string(threshold) +
			                            ")");
		}

		if (window_cap < MIN_WINDOW) {
			throw std::invalid_argument("window_cap must be at least 2 (got " + std::to_string(window_cap) + ")");
		}

		if (top_n == 0) {
			throw std::invalid_argument("top_n must be positive");
		}

		costs.Validate();
		loans.Validate();
		kpis.Validate();
	}
};

} // namespace core
} // namespace libriskscan
