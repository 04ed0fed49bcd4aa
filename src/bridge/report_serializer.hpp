#pragma once

#include "libriskscan/core/table.hpp"
#include "libriskscan/report/anomaly_report.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace riskscan {
namespace bridge {

/**
 * @brief Bridge layer for converting reports to JSON
 *
 * Handles conversion of:
 * - core::Table → array of row objects (keys in column order)
 * - Numeric cells → JSON numbers, NaN/Inf → null
 * - AnomalyReport → object with summary, cost_anomalies, loan_anomalies,
 *   kpi_anomalies, combined, failures, total_anomalies, partial
 *
 * Key order is stable, so the same report always serializes to the same text.
 */
class ReportSerializer {
public:
	using json = nlohmann::ordered_json;

	/**
	 * @brief Convert a table to an array of row objects
	 *
	 * @param table Table to convert (may be empty)
	 * @return JSON array with one object per row
	 */
	static json TableToJson(const libriskscan::core::Table &table);

	/**
	 * @brief Convert summary rows to JSON
	 */
	static json SummaryToJson(const std::vector<libriskscan::report::CategorySummary> &summary);

	/**
	 * @brief Convert category failures to JSON
	 */
	static json FailuresToJson(const std::vector<libriskscan::report::CategoryFailure> &failures);

	/**
	 * @brief Convert a whole report to JSON
	 */
	static json ReportToJson(const libriskscan::report::AnomalyReport &report);

	/**
	 * @brief Serialize a report to text
	 *
	 * @param report Report to serialize
	 * @param indent Spaces per level; negative for single-line output
	 * @return JSON text
	 */
	static std::string Serialize(const libriskscan::report::AnomalyReport &report, int indent = 2);

private:
	static json NumberOrNull(double value);
};

} // namespace bridge
} // namespace riskscan
