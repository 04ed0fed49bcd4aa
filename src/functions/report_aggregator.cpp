#include "report_aggregator.hpp"
#include "../utils/tracing.hpp"
#include "../utils/validation.hpp"
#include "libriskscan/detectors/cross_sectional_detector.hpp"
#include "libriskscan/detectors/time_series_detector.hpp"
#include "libriskscan/stats/score_calculator.hpp"
#include <exception>
#include <string>
#include <vector>

namespace riskscan {

using libriskscan::core::CrossSectionalSpec;
using libriskscan::core::DetectionOptions;
using libriskscan::core::Table;
using libriskscan::detectors::CrossSectionalDetector;
using libriskscan::detectors::TimeSeriesDetector;
using libriskscan::report::AnomalyReport;
using libriskscan::report::CategoryFailure;
using libriskscan::report::ReportBuilder;
using libriskscan::stats::ScoreCalculator;

namespace {

/**
 * Run one category's detection, converting an exception into a failure entry
 */
template <class DETECT>
Table RunCategory(const std::string &category, std::vector<CategoryFailure> &failures, DETECT detect) {
	RISKSCAN_TIMING_START();
	try {
		Table result = detect();
		RISKSCAN_TIMING_END(category + " detection");
		return result;
	} catch (const std::exception &e) {
		RISKSCAN_ERROR(category << " detection failed: " << e.what());
		failures.push_back(CategoryFailure {category, e.what()});
		return Table();
	}
}

} // namespace

Table ReportAggregator::DetectCrossSectional(const Table &data, const CrossSectionalSpec &spec,
                                             const DetectionOptions &options) {
	RISKSCAN_DEBUG("Scoring " << data.RowCount() << " " << spec.category << " records on "
	                          << spec.watched_fields.size() << " fields");

	auto with_gaps = ValidationUtils::ValidateCrossSectionalInput(data, spec);
	for (const auto &col : with_gaps) {
		RISKSCAN_WARN(spec.category << ": column '" << col << "' has "
		                            << ValidationUtils::CountNonFinite(data.NumericColumn(col))
		                            << " missing or non-finite values; those records are not scored on it");
	}

	const size_t missing_magnitude = ValidationUtils::CountNonFinite(data.NumericColumn(spec.magnitude_column));
	if (missing_magnitude > 0) {
		RISKSCAN_WARN(spec.category << ": magnitude column '" << spec.magnitude_column << "' has "
		                            << missing_magnitude << " missing or non-finite values; missing ones are "
		                            << "left out of the aggregate magnitude");
	}

	Table anomalies = CrossSectionalDetector::Detect(data, spec, options);
	RISKSCAN_INFO("Detected " << anomalies.RowCount() << " " << spec.category << " anomalies");
	return anomalies;
}

Table ReportAggregator::DetectTimeSeries(const Table &series, const DetectionOptions &options) {
	const auto &spec = options.kpis;
	RISKSCAN_DEBUG("Checking " << spec.metrics.size() << " metrics over " << series.RowCount() << " periods");

	auto absent = ValidationUtils::ValidateTimeSeriesInput(series, spec);
	for (const auto &metric : absent) {
		RISKSCAN_WARN(spec.category << ": metric '" << metric << "' not present in the series, skipped");
	}

	const size_t window = TimeSeriesDetector::WindowSize(series.RowCount(), options.window_cap);
	if (window < TimeSeriesDetector::MIN_WINDOW) {
		RISKSCAN_INFO(spec.category << ": " << series.RowCount() << " periods are not enough history");
	}

	Table anomalies = TimeSeriesDetector::DetectMetrics(series, spec, options);
	RISKSCAN_INFO("Detected " << anomalies.RowCount() << " " << spec.category << " anomalies");
	return anomalies;
}

AnomalyReport ReportAggregator::Generate(const Table &costs, const Table &loans, const Table &kpis,
                                         const DetectionOptions &options) {
	options.Validate();

	Tracer::Section("ANOMALY DETECTION");
	RISKSCAN_TIMING_START();

	const double ceiling = ScoreCalculator::MaxAttainableRollingScore(options.window_cap);
	if (options.threshold >= ceiling) {
		RISKSCAN_WARN("Threshold " << options.threshold << " is not below the largest rolling score a window of "
		                           << options.window_cap << " can produce (" << ceiling
		                           << "); no KPI point can be flagged");
	}

	AnomalyReport report;
	report.cost_anomalies = RunCategory(options.costs.category, report.failures,
	                                    [&]() { return DetectCrossSectional(costs, options.costs, options); });
	report.loan_anomalies = RunCategory(options.loans.category, report.failures,
	                                    [&]() { return DetectCrossSectional(loans, options.loans, options); });
	report.kpi_anomalies =
	    RunCategory(options.kpis.category, report.failures, [&]() { return DetectTimeSeries(kpis, options); });

	if (auto row = ReportBuilder::SummarizeCrossSectional(report.cost_anomalies, options.costs)) {
		report.summary.push_back(*row);
	}
	if (auto row = ReportBuilder::SummarizeCrossSectional(report.loan_anomalies, options.loans)) {
		report.summary.push_back(*row);
	}
	if (auto row = ReportBuilder::SummarizeTimeSeries(report.kpi_anomalies, options.kpis)) {
		report.summary.push_back(*row);
	}

	report.combined = Table::Concat({ReportBuilder::TopFindings(report.cost_anomalies, options.costs, options.top_n),
	                                 ReportBuilder::TopFindings(report.loan_anomalies, options.loans, options.top_n)});

	LogSummary(report);
	RISKSCAN_TIMING_END("Anomaly report");
	return report;
}

void ReportAggregator::LogSummary(const AnomalyReport &report) {
	for (const auto &row : report.summary) {
		RISKSCAN_INFO(row.category << ": " << row.anomaly_count << " anomalies, top issue '" << row.top_issue
		                           << "', max severity " << row.max_severity);
	}
	for (const auto &failure : report.failures) {
		RISKSCAN_WARN(failure.category << ": no results (" << failure.message << ")");
	}
	RISKSCAN_INFO("Total anomalies detected: " << report.total_anomalies());
	if (report.is_partial()) {
		RISKSCAN_WARN("Report is partial: " << report.failures.size() << " categories failed");
	}
}

} // namespace riskscan
