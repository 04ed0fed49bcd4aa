#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace libriskscan {
namespace core {

/**
 * Raised when a table does not have the shape a detector needs
 *
 * Covers missing columns and columns of the wrong type. Missing column names
 * are kept so callers can report all of them at once.
 */
class SchemaError : public std::invalid_argument {
public:
	explicit SchemaError(const std::string &message, std::vector<std::string> missing_columns = {})
	    : std::invalid_argument(message), missing_columns_(std::move(missing_columns)) {
	}

	/// Names of the required columns that were absent (empty for type errors)
	const std::vector<std::string> &MissingColumns() const {
		return missing_columns_;
	}

private:
	std::vector<std::string> missing_columns_;
};

} // namespace core
} // namespace libriskscan
