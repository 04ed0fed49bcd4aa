#pragma once

#include "libriskscan/core/detection_options.hpp"
#include "libriskscan/core/table.hpp"
#include "libriskscan/stats/score_calculator.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

namespace libriskscan {
namespace detectors {

/**
 * Cross-Sectional Anomaly Detector
 *
 * Flags individual records whose standardized score on any watched field
 * exceeds the threshold. Each field is scored against its own whole column.
 *
 * Algorithm:
 * 1. z_j = ScoreCalculator::ZScores(column_j) for each watched field j
 * 2. Flag row i if |z_j[i]| > T for at least one j (union of per-field outliers)
 * 3. anomaly_type = label of the first field, in declared order, with |z| > T.
 *    An earlier field wins even when a later field has the larger score.
 * 4. severity = max_j |z_j[i]|
 * 5. Stable sort by severity, descending
 *
 * Output columns: every input column, one score column per watched field,
 * then "anomaly_type" and "severity". Rows are a subset of the input rows.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 * - Returns a new table; the input is never modified
 */
class CrossSectionalDetector {
public:
	static constexpr const char *ANOMALY_TYPE_COLUMN = "anomaly_type";
	static constexpr const char *SEVERITY_COLUMN = "severity";

	/**
	 * Detect anomalous records
	 *
	 * @param data Dataset to scan
	 * @param spec Watched fields, in labeling priority order
	 * @param options Threshold (other fields unused here)
	 * @return Flagged rows with score, anomaly_type and severity columns,
	 *         sorted by severity descending; empty (with the same columns)
	 *         when nothing is flagged or the dataset is empty
	 * @throws core::SchemaError if a watched column is missing or not numeric
	 * @throws std::invalid_argument if the options or the category definition are invalid
	 */
	static core::Table Detect(const core::Table &data, const core::CrossSectionalSpec &spec,
	                          const core::DetectionOptions &options = core::DetectionOptions::Defaults());

	/**
	 * Score every row without filtering
	 *
	 * Same columns as Detect(); rows that are not flagged carry an empty
	 * anomaly_type. Input order is kept.
	 */
	static core::Table ScoreAll(const core::Table &data, const core::CrossSectionalSpec &spec,
	                            const core::DetectionOptions &options = core::DetectionOptions::Defaults());
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::Table CrossSectionalDetector::ScoreAll(const core::Table &data, const core::CrossSectionalSpec &spec,
                                                    const core::DetectionOptions &options) {
	options.Validate();
	spec.Validate();
	data.RequireColumns(spec.WatchedColumns(), spec.category);

	const size_t n = data.RowCount();
	const double threshold = options.threshold;

	std::vector<Eigen::VectorXd> scores;
	scores.reserve(spec.watched_fields.size());
	for (const auto &field : spec.watched_fields) {
		scores.push_back(stats::ScoreCalculator::ZScores(data.NumericColumn(field.column)));
	}

	std::vector<std::string> labels(n);
	Eigen::VectorXd severity = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n));

	for (size_t i = 0; i < n; i++) {
		const auto row = static_cast<Eigen::Index>(i);
		for (size_t j = 0; j < spec.watched_fields.size(); j++) {
			const double magnitude = std::abs(scores[j](row));
			if (std::isnan(magnitude)) {
				continue;
			}
			severity(row) = std::max(severity(row), magnitude);
			// First match wins: later fields never relabel the record
			if (labels[i].empty() && magnitude > threshold) {
				labels[i] = spec.watched_fields[j].label;
			}
		}
	}

	core::Table result = data;
	for (size_t j = 0; j < spec.watched_fields.size(); j++) {
		result = result.WithColumn(core::Column::Numeric(spec.watched_fields[j].score_column, scores[j]));
	}
	result = result.WithColumn(core::Column::Text(ANOMALY_TYPE_COLUMN, std::move(labels)));
	result = result.WithColumn(core::Column::Numeric(SEVERITY_COLUMN, std::move(severity)));
	return result;
}

inline core::Table CrossSectionalDetector::Detect(const core::Table &data, const core::CrossSectionalSpec &spec,
                                                  const core::DetectionOptions &options) {
	core::Table scored = ScoreAll(data, spec, options);

	const auto &labels = scored.GetColumn(ANOMALY_TYPE_COLUMN).text;
	const Eigen::VectorXd &severity = scored.NumericColumn(SEVERITY_COLUMN);

	std::vector<size_t> flagged;
	for (size_t i = 0; i < labels.size(); i++) {
		if (!labels[i].empty()) {
			flagged.push_back(i);
		}
	}

	std::stable_sort(flagged.begin(), flagged.end(), [&](size_t a, size_t b) {
		return severity(static_cast<Eigen::Index>(a)) > severity(static_cast<Eigen::Index>(b));
	});

	return scored.SelectRows(flagged);
}

} // namespace detectors
} // namespace libriskscan
