#pragma once

#include "libriskscan/core/detection_options.hpp"
#include "libriskscan/core/table.hpp"
#include "libriskscan/stats/score_calculator.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace libriskscan {
namespace detectors {

/**
 * Rolling-Window Time-Series Anomaly Detector
 *
 * Flags points of one metric that deviate from a short trailing baseline,
 * as opposed to CrossSectionalDetector which scores against the whole
 * population.
 *
 * Algorithm:
 * 1. Stable sort by period key, ascending
 * 2. W = min(window_cap, n - 1); W < 2 means no signal yet (empty result)
 * 3. Trailing mean and sample std over the W points ending at each point
 * 4. score = (value - rolling_mean) / rolling_std
 * 5. Flag when |score| > T
 *
 * Points whose score is undefined are never flagged: the first W - 1 points
 * (incomplete window) and points whose window is flat (rolling_std == 0).
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class TimeSeriesDetector {
public:
	static constexpr size_t MIN_WINDOW = core::DetectionOptions::MIN_WINDOW;

	static constexpr const char *ROLLING_MEAN_COLUMN = "rolling_mean";
	static constexpr const char *ROLLING_STD_COLUMN = "rolling_std";
	static constexpr const char *ROLLING_SCORE_COLUMN = "rolling_z_score";
	static constexpr const char *METRIC_NAME_COLUMN = "kpi_name";
	static constexpr const char *VALUE_COLUMN = "value";

	/// Effective window for a series of n points: min(window_cap, n - 1)
	static size_t WindowSize(size_t n_points, size_t window_cap) {
		if (n_points == 0) {
			return 0;
		}
		return std::min(window_cap, n_points - 1);
	}

	/**
	 * Detect anomalies in a single metric
	 *
	 * @param series Table holding the period key and the metric
	 * @param value_column Metric column (numeric)
	 * @param period_column Period key column; keys must be unique
	 * @param options Threshold and window cap
	 * @return Flagged rows (all input columns plus rolling_mean, rolling_std,
	 *         rolling_z_score) in period order; empty with the same columns
	 *         when there is not enough history or nothing is flagged
	 * @throws core::SchemaError if a column is missing or the metric is not numeric
	 * @throws std::invalid_argument on duplicate period keys or invalid options
	 */
	static core::Table Detect(const core::Table &series, const std::string &value_column,
	                          const std::string &period_column,
	                          const core::DetectionOptions &options = core::DetectionOptions::Defaults());

	/**
	 * Detect anomalies in every tracked metric and concatenate the results
	 *
	 * Metrics whose column is absent from the series are skipped.
	 *
	 * @return Columns: <period>, kpi_name, value, rolling_mean, rolling_std,
	 *         rolling_z_score; metrics appear in the order of spec.metrics
	 * @throws core::SchemaError if the period column is missing
	 */
	static core::Table DetectMetrics(const core::Table &series, const core::TimeSeriesSpec &spec,
	                                 const core::DetectionOptions &options = core::DetectionOptions::Defaults());

private:
	static void CheckUniquePeriods(const core::Table &sorted, const std::string &period_column);

	static core::Table MetricRows(const core::Table &flagged, const std::string &metric,
	                              const std::string &period_column);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void TimeSeriesDetector::CheckUniquePeriods(const core::Table &sorted, const std::string &period_column) {
	const core::Column &col = sorted.GetColumn(period_column);
	for (size_t i = 1; i < col.size(); i++) {
		bool same;
		if (col.is_numeric()) {
			same = col.numeric(static_cast<Eigen::Index>(i)) == col.numeric(static_cast<Eigen::Index>(i - 1));
		} else {
			same = col.text[i] == col.text[i - 1];
		}
		if (same) {
			throw std::invalid_argument("Duplicate period key '" + sorted.FormatCell(period_column, i) +
			                            "' in column '" + period_column + "'");
		}
	}
}

inline core::Table TimeSeriesDetector::Detect(const core::Table &series, const std::string &value_column,
                                              const std::string &period_column,
                                              const core::DetectionOptions &options) {
	options.Validate();
	series.RequireColumns({period_column, value_column}, "time series");
	// Type check before any work
	series.NumericColumn(value_column);

	core::Table sorted = series.StableSortedBy(period_column);
	CheckUniquePeriods(sorted, period_column);

	const size_t n = sorted.RowCount();
	const size_t window = WindowSize(n, options.window_cap);

	if (window < MIN_WINDOW) {
		Eigen::VectorXd none(0);
		return sorted.SelectRows({})
		    .WithColumn(core::Column::Numeric(ROLLING_MEAN_COLUMN, none))
		    .WithColumn(core::Column::Numeric(ROLLING_STD_COLUMN, none))
		    .WithColumn(core::Column::Numeric(ROLLING_SCORE_COLUMN, none));
	}

	const Eigen::VectorXd &values = sorted.NumericColumn(value_column);
	stats::RollingStatistics rolling = stats::ScoreCalculator::Rolling(values, window);
	Eigen::VectorXd scores = stats::ScoreCalculator::RollingScores(values, rolling);

	std::vector<size_t> flagged;
	for (size_t i = 0; i < n; i++) {
		const double score = scores(static_cast<Eigen::Index>(i));
		if (!std::isnan(score) && std::abs(score) > options.threshold) {
			flagged.push_back(i);
		}
	}

	return sorted.WithColumn(core::Column::Numeric(ROLLING_MEAN_COLUMN, rolling.mean))
	    .WithColumn(core::Column::Numeric(ROLLING_STD_COLUMN, rolling.std_dev))
	    .WithColumn(core::Column::Numeric(ROLLING_SCORE_COLUMN, scores))
	    .SelectRows(flagged);
}

inline core::Table TimeSeriesDetector::MetricRows(const core::Table &flagged, const std::string &metric,
                                                  const std::string &period_column) {
	const size_t n = flagged.RowCount();
	std::vector<core::Column> columns;
	columns.push_back(flagged.GetColumn(period_column));
	columns.push_back(core::Column::Text(METRIC_NAME_COLUMN, std::vector<std::string>(n, metric)));

	core::Column value = flagged.GetColumn(metric);
	value.name = VALUE_COLUMN;
	columns.push_back(std::move(value));

	columns.push_back(flagged.GetColumn(ROLLING_MEAN_COLUMN));
	columns.push_back(flagged.GetColumn(ROLLING_STD_COLUMN));
	columns.push_back(flagged.GetColumn(ROLLING_SCORE_COLUMN));
	return core::Table(std::move(columns));
}

inline core::Table TimeSeriesDetector::DetectMetrics(const core::Table &series, const core::TimeSeriesSpec &spec,
                                                     const core::DetectionOptions &options) {
	options.Validate();
	spec.Validate();
	series.RequireColumns({spec.period_column}, spec.category);

	std::vector<core::Table> parts;
	for (const auto &metric : spec.metrics) {
		if (!series.HasColumn(metric)) {
			continue;
		}
		core::Table flagged = Detect(series, metric, spec.period_column, options);
		parts.push_back(MetricRows(flagged, metric, spec.period_column));
	}

	if (parts.empty()) {
		// No tracked metric present: empty table with the usual columns
		Eigen::VectorXd none(0);
		std::vector<core::Column> columns;
		columns.push_back(series.SelectRows({}).GetColumn(spec.period_column));
		columns.push_back(core::Column::Text(METRIC_NAME_COLUMN, {}));
		columns.push_back(core::Column::Numeric(VALUE_COLUMN, none));
		columns.push_back(core::Column::Numeric(ROLLING_MEAN_COLUMN, none));
		columns.push_back(core::Column::Numeric(ROLLING_STD_COLUMN, none));
		columns.push_back(core::Column::Numeric(ROLLING_SCORE_COLUMN, none));
		return core::Table(std::move(columns));
	}

	return core::Table::Concat(parts);
}

} // namespace detectors
} // namespace libriskscan
