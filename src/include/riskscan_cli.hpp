#pragma once

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace riskscan {

/**
 * Command-line options of the riskscan executable
 */
struct CliOptions {
	std::string costs_path;
	std::string loans_path;
	std::string kpis_path;

	/// Optional JSON configuration; empty means built-in defaults
	std::string config_path;

	/// Overrides RISKSCAN_LOG_LEVEL when set
	std::string log_level;

	/// JSON indentation; negative prints a single line
	int indent = 2;

	bool show_help = false;
};

/**
 * Invalid command line (unknown flag, missing value or missing input)
 */
class CliUsageError : public std::invalid_argument {
public:
	explicit CliUsageError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * Parse arguments (without the program name)
 *
 * @throws CliUsageError on unknown or incomplete arguments
 */
CliOptions ParseCliArguments(const std::vector<std::string> &args);

/// Usage text
std::string CliUsage();

/**
 * Run the full pipeline: load inputs, detect, print the JSON report
 *
 * @param args Arguments without the program name
 * @param out Receives the JSON report (or the usage text for --help)
 * @param err Receives error messages
 * @return 0 on success (partial reports included), 1 on a runtime error,
 *         2 on a usage error
 */
int RunCli(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);

} // namespace riskscan
