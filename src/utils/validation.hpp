#pragma once

#include "libriskscan/core/detection_options.hpp"
#include "libriskscan/core/table.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace riskscan {

/**
 * @brief Input validation utilities for the application layer
 *
 * Provides validation for:
 * - Column existence and naming
 * - Data types (numeric columns)
 * - Missing and non-finite values
 * - Per-category input checks run before detection
 */
class ValidationUtils {
public:
	/**
	 * @brief Find a column position by name
	 *
	 * @param column_names Vector of column names to search
	 * @param col_name Column name to find
	 * @return Column index if found
	 * @throws libriskscan::core::SchemaError if not found
	 */
	static size_t FindColumnByName(const std::vector<std::string> &column_names, const std::string &col_name);

	/**
	 * @brief Validate that all named columns exist
	 *
	 * @param table Table to check
	 * @param col_names Required column names
	 * @param context Dataset name for the error message
	 * @throws libriskscan::core::SchemaError listing every missing column
	 */
	static void ValidateRequiredColumns(const libriskscan::core::Table &table, const std::vector<std::string> &col_names,
	                                    const std::string &context);

	/**
	 * @brief Validate that a column is numeric
	 *
	 * @param table Table holding the column
	 * @param col_name Column to check
	 * @param context Dataset name for the error message
	 * @throws libriskscan::core::SchemaError if missing or text
	 */
	static void ValidateNumericColumn(const libriskscan::core::Table &table, const std::string &col_name,
	                                  const std::string &context);

	/**
	 * @brief Validate that a column list is non-empty
	 *
	 * @param col_names Column names
	 * @param what Description for the error message
	 * @throws std::invalid_argument if empty
	 */
	static void ValidateNonEmptyColumnList(const std::vector<std::string> &col_names, const std::string &what);

	/**
	 * @brief Count missing (NaN) or infinite entries
	 *
	 * @param values Values to check
	 * @return Number of non-finite entries
	 */
	static size_t CountNonFinite(const Eigen::VectorXd &values);

	/**
	 * @brief Check a vector for NaN or infinite entries
	 */
	static bool HasNonFiniteValues(const Eigen::VectorXd &values) {
		return CountNonFinite(values) > 0;
	}

	/**
	 * @brief Validate a cross-sectional dataset before detection
	 *
	 * Requires the id, group and magnitude columns plus every watched field;
	 * watched fields and the magnitude column must be numeric.
	 *
	 * @return Names of watched columns that contain non-finite values
	 * @throws libriskscan::core::SchemaError on missing or text columns
	 */
	static std::vector<std::string> ValidateCrossSectionalInput(const libriskscan::core::Table &table,
	                                                            const libriskscan::core::CrossSectionalSpec &spec);

	/**
	 * @brief Validate a time-series dataset before detection
	 *
	 * Requires the period column. Metrics are optional, but present ones must
	 * be numeric.
	 *
	 * @return Tracked metrics absent from the table, in declared order
	 * @throws libriskscan::core::SchemaError on a missing period column or a text metric
	 */
	static std::vector<std::string> ValidateTimeSeriesInput(const libriskscan::core::Table &table,
	                                                        const libriskscan::core::TimeSeriesSpec &spec);
};

} // namespace riskscan
