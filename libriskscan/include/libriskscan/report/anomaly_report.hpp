#pragma once

#include "libriskscan/core/detection_options.hpp"
#include "libriskscan/core/table.hpp"
#include "libriskscan/detectors/cross_sectional_detector.hpp"
#include "libriskscan/detectors/time_series_detector.hpp"
#include "libriskscan/stats/score_calculator.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace libriskscan {
namespace report {

/**
 * One row of the category summary
 */
struct CategorySummary {
	std::string category;

	/// Number of flagged rows in the category
	size_t anomaly_count = 0;

	/// Grouping value of the highest-ranked finding (business unit, loan type, metric)
	std::string top_issue;

	/// Largest severity in the category (max |rolling_z_score| for KPIs)
	double max_severity = 0.0;

	/// Category-specific sum: variance amount (costs), ECL (loans), 0 (KPIs)
	double aggregate_magnitude = 0.0;

	bool operator==(const CategorySummary &other) const {
		return category == other.category && anomaly_count == other.anomaly_count && top_issue == other.top_issue &&
		       max_severity == other.max_severity && aggregate_magnitude == other.aggregate_magnitude;
	}
};

/**
 * A category whose detection raised instead of producing results
 */
struct CategoryFailure {
	std::string category;
	std::string message;

	bool operator==(const CategoryFailure &other) const {
		return category == other.category && message == other.message;
	}
};

/**
 * Result of one multi-category detection run
 *
 * A failed category has an empty anomaly table, no summary row and an
 * entry in `failures`.
 */
struct AnomalyReport {
	std::vector<CategorySummary> summary;
	core::Table cost_anomalies;
	core::Table loan_anomalies;
	core::Table kpi_anomalies;
	core::Table combined;
	std::vector<CategoryFailure> failures;

	bool is_partial() const {
		return !failures.empty();
	}

	size_t total_anomalies() const {
		return cost_anomalies.RowCount() + loan_anomalies.RowCount() + kpi_anomalies.RowCount();
	}

	bool operator==(const AnomalyReport &other) const {
		return summary == other.summary && cost_anomalies == other.cost_anomalies &&
		       loan_anomalies == other.loan_anomalies && kpi_anomalies == other.kpi_anomalies &&
		       combined == other.combined && failures == other.failures;
	}
};

/**
 * Report assembly from detector output
 *
 * Pure functions over already-detected tables; the orchestration (running
 * detectors, isolating failures, logging) lives in the application layer.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class ReportBuilder {
public:
	static constexpr const char *RECORD_ID_COLUMN = "record_id";
	static constexpr const char *GROUP_COLUMN = "group";
	static constexpr const char *CATEGORY_COLUMN = "category";

	/**
	 * Summary row for a cross-sectional result
	 *
	 * @param anomalies Output of CrossSectionalDetector::Detect (severity-sorted)
	 * @param spec Category the result belongs to
	 * @return Summary, or nullopt when there are no anomalies
	 */
	static std::optional<CategorySummary> SummarizeCrossSectional(const core::Table &anomalies,
	                                                              const core::CrossSectionalSpec &spec);

	/// Summary row for the concatenated KPI result; nullopt when empty
	static std::optional<CategorySummary> SummarizeTimeSeries(const core::Table &anomalies,
	                                                          const core::TimeSeriesSpec &spec);

	/**
	 * Top findings of one cross-sectional category in combined-table shape
	 *
	 * Columns: record_id, group, anomaly_type, severity, category
	 */
	static core::Table TopFindings(const core::Table &anomalies, const core::CrossSectionalSpec &spec, size_t top_n);

	/// Combined-table columns with zero rows
	static core::Table EmptyFindings();
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::optional<CategorySummary>
ReportBuilder::SummarizeCrossSectional(const core::Table &anomalies, const core::CrossSectionalSpec &spec) {
	if (anomalies.Empty()) {
		return std::nullopt;
	}
	anomalies.RequireColumns({spec.group_column, spec.magnitude_column,
	                          detectors::CrossSectionalDetector::SEVERITY_COLUMN},
	                         spec.category + " anomalies");

	CategorySummary row;
	row.category = spec.category;
	row.anomaly_count = anomalies.RowCount();
	row.top_issue = anomalies.FormatCell(spec.group_column, 0);
	row.max_severity = anomalies.NumericColumn(detectors::CrossSectionalDetector::SEVERITY_COLUMN).maxCoeff();
	// Missing magnitudes do not count toward the total
	const Eigen::VectorXd &magnitude = anomalies.NumericColumn(spec.magnitude_column);
	row.aggregate_magnitude = stats::ScoreCalculator::Observed(magnitude).sum();
	return row;
}

inline std::optional<CategorySummary> ReportBuilder::SummarizeTimeSeries(const core::Table &anomalies,
                                                                        const core::TimeSeriesSpec &spec) {
	if (anomalies.Empty()) {
		return std::nullopt;
	}

	CategorySummary row;
	row.category = spec.category;
	row.anomaly_count = anomalies.RowCount();
	row.top_issue = anomalies.FormatCell(detectors::TimeSeriesDetector::METRIC_NAME_COLUMN, 0);
	row.max_severity =
	    anomalies.NumericColumn(detectors::TimeSeriesDetector::ROLLING_SCORE_COLUMN).cwiseAbs().maxCoeff();
	// Heterogeneous metrics have no comparable magnitude
	row.aggregate_magnitude = 0.0;
	return row;
}

inline core::Table ReportBuilder::EmptyFindings() {
	return core::Table({core::Column::Text(RECORD_ID_COLUMN, {}), core::Column::Text(GROUP_COLUMN, {}),
	                    core::Column::Text(detectors::CrossSectionalDetector::ANOMALY_TYPE_COLUMN, {}),
	                    core::Column::Numeric(detectors::CrossSectionalDetector::SEVERITY_COLUMN, Eigen::VectorXd()),
	                    core::Column::Text(CATEGORY_COLUMN, {})});
}

inline core::Table ReportBuilder::TopFindings(const core::Table &anomalies, const core::CrossSectionalSpec &spec,
                                              size_t top_n) {
	if (anomalies.Empty()) {
		return EmptyFindings();
	}
	anomalies.RequireColumns({spec.id_column, spec.group_column}, spec.category + " anomalies");

	core::Table head = anomalies.Head(top_n);
	const size_t n = head.RowCount();

	std::vector<std::string> ids;
	std::vector<std::string> groups;
	ids.reserve(n);
	groups.reserve(n);
	for (size_t i = 0; i < n; i++) {
		ids.push_back(head.FormatCell(spec.id_column, i));
		groups.push_back(head.FormatCell(spec.group_column, i));
	}

	return core::Table({core::Column::Text(RECORD_ID_COLUMN, std::move(ids)),
	                    core::Column::Text(GROUP_COLUMN, std::move(groups)),
	                    head.GetColumn(detectors::CrossSectionalDetector::ANOMALY_TYPE_COLUMN),
	                    head.GetColumn(detectors::CrossSectionalDetector::SEVERITY_COLUMN),
	                    core::Column::Text(CATEGORY_COLUMN, std::vector<std::string>(n, spec.tag))});
}

} // namespace report
} // namespace libriskscan
