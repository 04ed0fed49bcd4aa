#pragma once

#include "libriskscan/core/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace libriskscan {
namespace core {

enum class ColumnType { NUMERIC, TEXT };

/**
 * A single named, typed column
 *
 * Numeric columns live in an Eigen vector so the statistics code can work on
 * them directly; text columns (identifiers, labels, ISO dates) are strings.
 * Only the storage matching `type` is populated.
 */
struct Column {
	std::string name;
	ColumnType type = ColumnType::NUMERIC;
	Eigen::VectorXd numeric;
	std::vector<std::string> text;

	static Column Numeric(std::string name_, Eigen::VectorXd values) {
		Column col;
		col.name = std::move(name_);
		col.type = ColumnType::NUMERIC;
		col.numeric = std::move(values);
		return col;
	}

	static Column Numeric(std::string name_, const std::vector<double> &values) {
		Eigen::VectorXd vec(static_cast<Eigen::Index>(values.size()));
		for (size_t i = 0; i < values.size(); i++) {
			vec(static_cast<Eigen::Index>(i)) = values[i];
		}
		return Numeric(std::move(name_), std::move(vec));
	}

	static Column Text(std::string name_, std::vector<std::string> values) {
		Column col;
		col.name = std::move(name_);
		col.type = ColumnType::TEXT;
		col.text = std::move(values);
		return col;
	}

	size_t size() const {
		return type == ColumnType::NUMERIC ? static_cast<size_t>(numeric.size()) : text.size();
	}

	bool is_numeric() const {
		return type == ColumnType::NUMERIC;
	}

	/// Cell-wise equality; NaN cells compare equal to each other
	bool operator==(const Column &other) const;

	bool operator!=(const Column &other) const {
		return !(*this == other);
	}
};

/**
 * Immutable columnar table
 *
 * Every transforming operation returns a new Table and leaves the receiver
 * untouched, so a caller's dataset can be handed to several detectors without
 * copies being mutated behind its back.
 *
 * All columns have the same length. A table without columns has zero rows.
 */
class Table {
public:
	Table() = default;

	/**
	 * Build a table from columns
	 *
	 * @throws std::invalid_argument if lengths differ or a name repeats
	 */
	explicit Table(std::vector<Column> columns);

	size_t RowCount() const {
		return columns_.empty() ? 0 : columns_.front().size();
	}

	size_t ColumnCount() const {
		return columns_.size();
	}

	bool Empty() const {
		return RowCount() == 0;
	}

	const std::vector<Column> &Columns() const {
		return columns_;
	}

	std::vector<std::string> ColumnNames() const;

	bool HasColumn(const std::string &name) const {
		return FindIndex(name) != NOT_FOUND;
	}

	/**
	 * Look up a column by name
	 *
	 * @throws SchemaError if the column does not exist
	 */
	const Column &GetColumn(const std::string &name) const;

	/**
	 * Numeric storage of a column
	 *
	 * @throws SchemaError if the column is missing or holds text
	 */
	const Eigen::VectorXd &NumericColumn(const std::string &name) const;

	/// Names from `required` that are not present, in the order given
	std::vector<std::string> MissingColumns(const std::vector<std::string> &required) const;

	/**
	 * Check that all required columns exist
	 *
	 * @param required Column names that must be present
	 * @param context Dataset name used in the error message
	 * @throws SchemaError listing every missing column
	 */
	void RequireColumns(const std::vector<std::string> &required, const std::string &context) const;

	/// Render one cell as text: integral numbers without fraction, NaN as ""
	std::string FormatCell(const std::string &name, size_t row) const;

	/// Copy with `column` appended, or replacing a column of the same name
	Table WithColumn(Column column) const;

	/// Copy holding only the given rows, in the given order
	Table SelectRows(const std::vector<size_t> &rows) const;

	/// Copy holding the first `n` rows
	Table Head(size_t n) const;

	/// Copy holding only the named columns, in the given order
	Table Project(const std::vector<std::string> &names) const;

	/**
	 * Row order that stably sorts by one column
	 *
	 * Numeric columns sort numerically with NaN last, text columns
	 * lexicographically. Equal keys keep their original order.
	 */
	std::vector<size_t> StableOrder(const std::string &name, bool ascending = true) const;

	Table StableSortedBy(const std::string &name, bool ascending = true) const {
		return SelectRows(StableOrder(name, ascending));
	}

	/**
	 * Stack tables vertically
	 *
	 * Tables without columns are skipped. The remaining tables must share
	 * column names, order and types.
	 *
	 * @throws std::invalid_argument on schema mismatch
	 */
	static Table Concat(const std::vector<Table> &tables);

	bool operator==(const Table &other) const {
		return columns_ == other.columns_;
	}

	bool operator!=(const Table &other) const {
		return !(*this == other);
	}

private:
	static constexpr size_t NOT_FOUND = std::numeric_limits<size_t>::max();

	size_t FindIndex(const std::string &name) const;

	std::vector<Column> columns_;
};

/// Format a double the way tables render numeric cells
inline std::string FormatNumber(double value);

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline bool Column::operator==(const Column &other) const {
	if (name != other.name || type != other.type || size() != other.size()) {
		return false;
	}
	if (type == ColumnType::TEXT) {
		return text == other.text;
	}
	for (Eigen::Index i = 0; i < numeric.size(); i++) {
		const double a = numeric(i);
		const double b = other.numeric(i);
		if (std::isnan(a) && std::isnan(b)) {
			continue;
		}
		if (a != b) {
			return false;
		}
	}
	return true;
}

inline std::string FormatNumber(double value) {
	if (std::isnan(value)) {
		return "";
	}
	if (std::isfinite(value) && value == std::floor(value) && std::abs(value) < 1e15) {
		return std::to_string(static_cast<int64_t>(value));
	}
	std::ostringstream oss;
	oss << std::setprecision(15) << value;
	return oss.str();
}

inline Table::Table(std::vector<Column> columns) : columns_(std::move(columns)) {
	for (size_t i = 0; i < columns_.size(); i++) {
		if (columns_[i].size() != columns_.front().size()) {
			throw std::invalid_argument("Column '" + columns_[i].name + "' has " +
			                            std::to_string(columns_[i].size()) + " rows, expected " +
			                            std::to_string(columns_.front().size()));
		}
		for (size_t j = 0; j < i; j++) {
			if (columns_[j].name == columns_[i].name) {
				throw std::invalid_argument("Duplicate column name '" + columns_[i].name + "'");
			}
		}
	}
}

inline size_t Table::FindIndex(const std::string &name) const {
	for (size_t i = 0; i < columns_.size(); i++) {
		if (columns_[i].name == name) {
			return i;
		}
	}
	return NOT_FOUND;
}

inline std::vector<std::string> Table::ColumnNames() const {
	std::vector<std::string> names;
	names.reserve(columns_.size());
	for (const auto &col : columns_) {
		names.push_back(col.name);
	}
	return names;
}

inline const Column &Table::GetColumn(const std::string &name) const {
	size_t idx = FindIndex(name);
	if (idx == NOT_FOUND) {
		throw SchemaError("Column '" + name + "' not found in table", {name});
	}
	return columns_[idx];
}

inline const Eigen::VectorXd &Table::NumericColumn(const std::string &name) const {
	const Column &col = GetColumn(name);
	if (!col.is_numeric()) {
		throw SchemaError("Column '" + name + "' must be numeric");
	}
	return col.numeric;
}

inline std::vector<std::string> Table::MissingColumns(const std::vector<std::string> &required) const {
	std::vector<std::string> missing;
	for (const auto &name : required) {
		if (!HasColumn(name) && std::find(missing.begin(), missing.end(), name) == missing.end()) {
			missing.push_back(name);
		}
	}
	return missing;
}

inline void Table::RequireColumns(const std::vector<std::string> &required, const std::string &context) const {
	auto missing = MissingColumns(required);
	if (missing.empty()) {
		return;
	}
	std::string list;
	for (size_t i = 0; i < missing.size(); i++) {
		if (i > 0) {
			list += ", ";
		}
		list += missing[i];
	}
	throw SchemaError(context + " missing required columns: " + list, std::move(missing));
}

inline std::string Table::FormatCell(const std::string &name, size_t row) const {
	const Column &col = GetColumn(name);
	if (row >= col.size()) {
		throw std::out_of_range("Row " + std::to_string(row) + " out of range for column '" + name + "'");
	}
	if (col.is_numeric()) {
		return FormatNumber(col.numeric(static_cast<Eigen::Index>(row)));
	}
	return col.text[row];
}

inline Table Table::WithColumn(Column column) const {
	if (!columns_.empty() && column.size() != RowCount()) {
		throw std::invalid_argument("Column '" + column.name + "' has " + std::to_string(column.size()) +
		                            " rows, table has " + std::to_string(RowCount()));
	}
	Table result = *this;
	size_t idx = FindIndex(column.name);
	if (idx == NOT_FOUND) {
		result.columns_.push_back(std::move(column));
	} else {
		result.columns_[idx] = std::move(column);
	}
	return result;
}

inline Table Table::SelectRows(const std::vector<size_t> &rows) const {
	const size_t n = RowCount();
	for (size_t row : rows) {
		if (row >= n) {
			throw std::out_of_range("Row index " + std::to_string(row) + " out of range (rows: " +
			                        std::to_string(n) + ")");
		}
	}

	std::vector<Column> selected;
	selected.reserve(columns_.size());
	for (const auto &col : columns_) {
		Column out;
		out.name = col.name;
		out.type = col.type;
		if (col.is_numeric()) {
			out.numeric.resize(static_cast<Eigen::Index>(rows.size()));
			for (size_t i = 0; i < rows.size(); i++) {
				out.numeric(static_cast<Eigen::Index>(i)) = col.numeric(static_cast<Eigen::Index>(rows[i]));
			}
		} else {
			out.text.reserve(rows.size());
			for (size_t row : rows) {
				out.text.push_back(col.text[row]);
			}
		}
		selected.push_back(std::move(out));
	}

	Table result;
	result.columns_ = std::move(selected);
	return result;
}

inline Table Table::Head(size_t n) const {
	std::vector<size_t> rows(std::min(n, RowCount()));
	std::iota(rows.begin(), rows.end(), 0);
	return SelectRows(rows);
}

inline Table Table::Project(const std::vector<std::string> &names) const {
	RequireColumns(names, "projection");
	std::vector<Column> projected;
	projected.reserve(names.size());
	for (const auto &name : names) {
		projected.push_back(GetColumn(name));
	}
	return Table(std::move(projected));
}

inline std::vector<size_t> Table::StableOrder(const std::string &name, bool ascending) const {
	const Column &col = GetColumn(name);
	std::vector<size_t> order(col.size());
	std::iota(order.begin(), order.end(), 0);

	if (col.is_numeric()) {
		const Eigen::VectorXd &v = col.numeric;
		std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
			const double va = v(static_cast<Eigen::Index>(a));
			const double vb = v(static_cast<Eigen::Index>(b));
			if (std::isnan(va) || std::isnan(vb)) {
				return !std::isnan(va) && std::isnan(vb);
			}
			return ascending ? va < vb : va > vb;
		});
	} else {
		const std::vector<std::string> &v = col.text;
		std::stable_sort(order.begin(), order.end(),
		                 [&](size_t a, size_t b) { return ascending ? v[a] < v[b] : v[b] < v[a]; });
	}
	return order;
}

inline Table Table::Concat(const std::vector<Table> &tables) {
	const Table *schema = nullptr;
	size_t total_rows = 0;
	for (const auto &table : tables) {
		if (table.ColumnCount() == 0) {
			continue;
		}
		if (schema == nullptr) {
			schema = &table;
		} else {
			if (table.ColumnCount() != schema->ColumnCount()) {
				throw std::invalid_argument("Cannot concatenate tables with different column counts");
			}
			for (size_t i = 0; i < table.ColumnCount(); i++) {
				const Column &a = schema->columns_[i];
				const Column &b = table.columns_[i];
				if (a.name != b.name || a.type != b.type) {
					throw std::invalid_argument("Cannot concatenate tables: column " + std::to_string(i) + " is '" +
					                            a.name + "' in one table and '" + b.name + "' in another");
				}
			}
		}
		total_rows += table.RowCount();
	}

	if (schema == nullptr) {
		return Table();
	}

	std::vector<Column> merged;
	merged.reserve(schema->ColumnCount());
	for (size_t i = 0; i < schema->ColumnCount(); i++) {
		Column out;
		out.name = schema->columns_[i].name;
		out.type = schema->columns_[i].type;
		if (out.is_numeric()) {
			out.numeric.resize(static_cast<Eigen::Index>(total_rows));
		} else {
			out.text.reserve(total_rows);
		}
		Eigen::Index offset = 0;
		for (const auto &table : tables) {
			if (table.ColumnCount() == 0) {
				continue;
			}
			const Column &src = table.columns_[i];
			if (out.is_numeric()) {
				out.numeric.segment(offset, src.numeric.size()) = src.numeric;
				offset += src.numeric.size();
			} else {
				out.text.insert(out.text.end(), src.text.begin(), src.text.end());
			}
		}
		merged.push_back(std::move(out));
	}

	Table result;
	result.columns_ = std::move(merged);
	return result;
}

} // namespace core
} // namespace libriskscan
