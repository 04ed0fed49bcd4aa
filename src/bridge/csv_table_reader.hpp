#pragma once

#include "libriskscan/core/table.hpp"
#include <string>
#include <vector>

namespace riskscan {
namespace bridge {

/**
 * @brief One parsed CSV record
 */
struct CsvRecord {
	/// 1-based line on which the record starts
	size_t line = 0;
	std::vector<std::string> fields;
};

/**
 * @brief Bridge layer for loading CSV files into libriskscan tables
 *
 * Handles:
 * - RFC 4180 quoting (quoted fields, doubled quotes, separators and line
 *   breaks inside quotes)
 * - LF and CRLF line ends, optional UTF-8 byte order mark
 * - Column type inference: NUMERIC when every non-empty cell parses
 *   completely as a number, TEXT otherwise
 * - Empty numeric cells as NaN
 *
 * The first record is the header. Blank lines are skipped. A record with a
 * different field count than the header is an error.
 */
class CsvTableReader {
public:
	/**
	 * @brief Read a CSV file into a table
	 *
	 * @param path File to read
	 * @return Table with one column per header field
	 * @throws std::runtime_error if the file cannot be opened or is malformed
	 */
	static libriskscan::core::Table ReadFile(const std::string &path);

	/**
	 * @brief Parse CSV text into a table
	 *
	 * @param text CSV content
	 * @param source Name used in error messages
	 * @throws std::runtime_error if the content is malformed
	 */
	static libriskscan::core::Table ReadString(const std::string &text, const std::string &source = "<string>");

	/**
	 * @brief Split CSV text into records
	 *
	 * @throws std::runtime_error on an unterminated quote or a stray character after a closing quote
	 */
	static std::vector<CsvRecord> ParseRecords(const std::string &text, const std::string &source = "<string>");

	/**
	 * @brief Parse a whole cell as a number
	 *
	 * Leading and trailing blanks are ignored.
	 *
	 * @param cell Cell text
	 * @param value Parsed value on success
	 * @return true if the entire cell is a number
	 */
	static bool TryParseNumber(const std::string &cell, double &value);
};

} // namespace bridge
} // namespace riskscan
