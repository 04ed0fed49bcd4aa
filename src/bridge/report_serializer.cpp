#include "report_serializer.hpp"
#include <cmath>

namespace riskscan {
namespace bridge {

using libriskscan::core::Column;
using libriskscan::core::Table;
using libriskscan::report::AnomalyReport;
using libriskscan::report::CategoryFailure;
using libriskscan::report::CategorySummary;

ReportSerializer::json ReportSerializer::NumberOrNull(double value) {
	// JSON has no NaN or Infinity
	if (!std::isfinite(value)) {
		return nullptr;
	}
	return value;
}

ReportSerializer::json ReportSerializer::TableToJson(const Table &table) {
	json rows = json::array();
	const auto &columns = table.Columns();
	for (size_t i = 0; i < table.RowCount(); i++) {
		json row = json::object();
		for (const Column &col : columns) {
			if (col.is_numeric()) {
				row[col.name] = NumberOrNull(col.numeric(static_cast<Eigen::Index>(i)));
			} else {
				row[col.name] = col.text[i];
			}
		}
		rows.push_back(std::move(row));
	}
	return rows;
}

ReportSerializer::json ReportSerializer::SummaryToJson(const std::vector<CategorySummary> &summary) {
	json rows = json::array();
	for (const auto &entry : summary) {
		json row = json::object();
		row["category"] = entry.category;
		row["anomaly_count"] = entry.anomaly_count;
		row["top_issue"] = entry.top_issue;
		row["max_severity"] = NumberOrNull(entry.max_severity);
		row["aggregate_magnitude"] = NumberOrNull(entry.aggregate_magnitude);
		rows.push_back(std::move(row));
	}
	return rows;
}

ReportSerializer::json ReportSerializer::FailuresToJson(const std::vector<CategoryFailure> &failures) {
	json rows = json::array();
	for (const auto &failure : failures) {
		json row = json::object();
		row["category"] = failure.category;
		row["message"] = failure.message;
		rows.push_back(std::move(row));
	}
	return rows;
}

ReportSerializer::json ReportSerializer::ReportToJson(const AnomalyReport &report) {
	json doc = json::object();
	doc["summary"] = SummaryToJson(report.summary);
	doc["cost_anomalies"] = TableToJson(report.cost_anomalies);
	doc["loan_anomalies"] = TableToJson(report.loan_anomalies);
	doc["kpi_anomalies"] = TableToJson(report.kpi_anomalies);
	doc["combined"] = TableToJson(report.combined);
	doc["failures"] = FailuresToJson(report.failures);
	doc["total_anomalies"] = report.total_anomalies();
	doc["partial"] = report.is_partial();
	return doc;
}

std::string ReportSerializer::Serialize(const AnomalyReport &report, int indent) {
	// Invalid UTF-8 in text cells is replaced instead of aborting the dump
	return ReportToJson(report).dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace bridge
} // namespace riskscan
