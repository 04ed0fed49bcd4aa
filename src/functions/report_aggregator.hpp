#pragma once

#include "libriskscan/core/detection_options.hpp"
#include "libriskscan/core/table.hpp"
#include "libriskscan/report/anomaly_report.hpp"

namespace riskscan {

/**
 * @brief Multi-category anomaly report
 *
 * Runs the cross-sectional detector on the cost ledger and on the loan
 * portfolio, and the time-series detector on every tracked KPI, then builds
 * the category summary and the combined top-N findings table.
 *
 * Each category runs inside its own failure boundary: an exception raised
 * while detecting one category is logged, recorded in
 * AnomalyReport::failures, and the remaining categories still run. A failed
 * category contributes an empty table (without columns) and no summary row.
 *
 * Summary rows appear in the order Costs, Loans, KPIs and only for
 * categories with at least one anomaly. KPI anomalies are not part of the
 * combined table.
 *
 * Example:
 *   auto report = ReportAggregator::Generate(costs, loans, kpis);
 *   for (const auto &row : report.summary) { ... }
 */
class ReportAggregator {
public:
	/**
	 * @brief Detect anomalies in all categories and assemble the report
	 *
	 * Detection runs once per category; the summary and the combined table
	 * reuse the detected tables.
	 *
	 * @param costs Cost ledger
	 * @param loans Loan portfolio
	 * @param kpis Monthly KPI series
	 * @param options Threshold, window cap, top-N and category definitions
	 * @return Report, partial when a category failed
	 * @throws std::invalid_argument if the options are invalid (before any detection)
	 */
	static libriskscan::report::AnomalyReport
	Generate(const libriskscan::core::Table &costs, const libriskscan::core::Table &loans,
	         const libriskscan::core::Table &kpis,
	         const libriskscan::core::DetectionOptions &options = libriskscan::core::DetectionOptions::Defaults());

private:
	static libriskscan::core::Table DetectCrossSectional(const libriskscan::core::Table &data,
	                                                     const libriskscan::core::CrossSectionalSpec &spec,
	                                                     const libriskscan::core::DetectionOptions &options);

	static libriskscan::core::Table DetectTimeSeries(const libriskscan::core::Table &series,
	                                                 const libriskscan::core::DetectionOptions &options);

	static void LogSummary(const libriskscan::report::AnomalyReport &report);
};

} // namespace riskscan
