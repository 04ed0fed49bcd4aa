#include "csv_table_reader.hpp"
#include "../utils/tracing.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace riskscan {
namespace bridge {

using libriskscan::core::Column;
using libriskscan::core::Table;

namespace {

constexpr char SEPARATOR = ',';
constexpr char QUOTE = '"';

std::runtime_error ParseError(const std::string &source, size_t line, const std::string &message) {
	return std::runtime_error(source + ":" + std::to_string(line) + ": " + message);
}

bool IsBlankRecord(const std::vector<std::string> &fields) {
	return fields.size() == 1 && fields[0].empty();
}

} // namespace

bool CsvTableReader::TryParseNumber(const std::string &cell, double &value) {
	const size_t begin = cell.find_first_not_of(" \t");
	if (begin == std::string::npos) {
		return false;
	}
	const size_t end = cell.find_last_not_of(" \t");
	const std::string trimmed = cell.substr(begin, end - begin + 1);

	const char *start = trimmed.c_str();
	char *stop = nullptr;
	const double parsed = std::strtod(start, &stop);
	if (stop == start || *stop != '\0') {
		return false;
	}
	value = parsed;
	return true;
}

std::vector<CsvRecord> CsvTableReader::ParseRecords(const std::string &text, const std::string &source) {
	std::vector<CsvRecord> records;

	size_t pos = 0;
	// UTF-8 byte order mark
	if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
		pos = 3;
	}

	size_t line = 1;
	CsvRecord record;
	record.line = line;
	std::string field;
	bool in_quotes = false;
	bool after_quote = false;
	bool record_open = false;

	auto end_field = [&]() {
		record.fields.push_back(std::move(field));
		field.clear();
		after_quote = false;
	};
	auto end_record = [&]() {
		end_field();
		if (!IsBlankRecord(record.fields)) {
			records.push_back(std::move(record));
		}
		record = CsvRecord();
		record.line = line;
		record_open = false;
	};

	while (pos < text.size()) {
		const char c = text[pos];

		if (in_quotes) {
			if (c == QUOTE) {
				if (pos + 1 < text.size() && text[pos + 1] == QUOTE) {
					field.push_back(QUOTE);
					pos += 2;
					continue;
				}
				in_quotes = false;
				after_quote = true;
			} else {
				if (c == '\n') {
					line++;
				}
				field.push_back(c);
			}
			pos++;
			continue;
		}

		if (c == SEPARATOR) {
			end_field();
			record_open = true;
		} else if (c == '\r' || c == '\n') {
			if (c == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') {
				pos++;
			}
			line++;
			end_record();
		} else if (after_quote) {
			throw ParseError(source, line, std::string("unexpected character '") + c + "' after closing quote");
		} else if (c == QUOTE && field.empty()) {
			in_quotes = true;
			record_open = true;
		} else {
			field.push_back(c);
			record_open = true;
		}
		pos++;
	}

	if (in_quotes) {
		throw ParseError(source, record.line, "unterminated quoted field");
	}
	if (record_open || !field.empty() || after_quote) {
		end_record();
	}
	return records;
}

Table CsvTableReader::ReadString(const std::string &text, const std::string &source) {
	std::vector<CsvRecord> records = ParseRecords(text, source);
	if (records.empty()) {
		throw std::runtime_error(source + ": missing header row");
	}

	const std::vector<std::string> &header = records.front().fields;
	const size_t n_cols = header.size();
	for (size_t j = 0; j < n_cols; j++) {
		if (header[j].empty()) {
			throw ParseError(source, records.front().line, "empty column name at position " + std::to_string(j + 1));
		}
		for (size_t k = 0; k < j; k++) {
			if (header[k] == header[j]) {
				throw ParseError(source, records.front().line, "duplicate column name '" + header[j] + "'");
			}
		}
	}

	const size_t n_rows = records.size() - 1;
	for (size_t i = 1; i < records.size(); i++) {
		if (records[i].fields.size() != n_cols) {
			throw ParseError(source, records[i].line,
			                 "expected " + std::to_string(n_cols) + " fields, found " +
			                     std::to_string(records[i].fields.size()));
		}
	}

	std::vector<Column> columns;
	columns.reserve(n_cols);
	for (size_t j = 0; j < n_cols; j++) {
		Eigen::VectorXd numeric(static_cast<Eigen::Index>(n_rows));
		bool is_numeric = true;
		for (size_t i = 0; i < n_rows && is_numeric; i++) {
			const std::string &cell = records[i + 1].fields[j];
			double value = std::numeric_limits<double>::quiet_NaN();
			if (cell.find_first_not_of(" \t") != std::string::npos && !TryParseNumber(cell, value)) {
				is_numeric = false;
			}
			numeric(static_cast<Eigen::Index>(i)) = value;
		}

		if (is_numeric) {
			columns.push_back(Column::Numeric(header[j], std::move(numeric)));
			continue;
		}

		std::vector<std::string> text_values;
		text_values.reserve(n_rows);
		for (size_t i = 0; i < n_rows; i++) {
			text_values.push_back(records[i + 1].fields[j]);
		}
		columns.push_back(Column::Text(header[j], std::move(text_values)));
	}

	RISKSCAN_DEBUG("Read " << n_rows << " rows, " << n_cols << " columns from " << source);
	return Table(std::move(columns));
}

Table CsvTableReader::ReadFile(const std::string &path) {
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		throw std::runtime_error("Cannot open CSV file '" + path + "'");
	}
	std::ostringstream buffer;
	buffer << in.rdbuf();
	return ReadString(buffer.str(), path);
}

} // namespace bridge
} // namespace riskscan
