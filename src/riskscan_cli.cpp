#include "include/riskscan_cli.hpp"
#include "bridge/csv_table_reader.hpp"
#include "bridge/report_serializer.hpp"
#include "functions/report_aggregator.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"
#include <cstdlib>
#include <ostream>

namespace riskscan {

using libriskscan::core::DetectionOptions;
using libriskscan::core::Table;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_RUNTIME_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;

const std::string &RequireValue(const std::vector<std::string> &args, size_t &i) {
	if (i + 1 >= args.size()) {
		throw CliUsageError("Option '" + args[i] + "' requires a value");
	}
	return args[++i];
}

int ParseIndent(const std::string &text) {
	const char *start = text.c_str();
	char *stop = nullptr;
	const long value = std::strtol(start, &stop, 10);
	if (stop == start || *stop != '\0' || value > 16) {
		throw CliUsageError("Option '--indent' expects an integer up to 16 (got '" + text + "')");
	}
	return value < 0 ? -1 : static_cast<int>(value);
}

} // namespace

std::string CliUsage() {
	return "Usage: riskscan --costs FILE --loans FILE --kpis FILE [OPTIONS]\n\n"
	       "Detects anomalies in a cost ledger, a loan portfolio and a monthly KPI series\n"
	       "and prints a JSON report to stdout.\n\n"
	       "INPUTS:\n"
	       "  --costs FILE         Cost records (CSV)\n"
	       "  --loans FILE         Loan records (CSV)\n"
	       "  --kpis FILE          Monthly KPI series (CSV)\n\n"
	       "OPTIONS:\n"
	       "  --config FILE        Detection options (JSON)\n"
	       "  --log-level LEVEL    trace, debug, info, warn, error or none\n"
	       "  --indent N           JSON indentation (default 2, negative for one line)\n"
	       "  -h, --help           Show this help\n";
}

CliOptions ParseCliArguments(const std::vector<std::string> &args) {
	CliOptions opts;

	for (size_t i = 0; i < args.size(); i++) {
		const std::string &arg = args[i];

		if (arg == "--costs") {
			opts.costs_path = RequireValue(args, i);
		} else if (arg == "--loans") {
			opts.loans_path = RequireValue(args, i);
		} else if (arg == "--kpis") {
			opts.kpis_path = RequireValue(args, i);
		} else if (arg == "--config") {
			opts.config_path = RequireValue(args, i);
		} else if (arg == "--log-level") {
			opts.log_level = RequireValue(args, i);
		} else if (arg == "--indent") {
			opts.indent = ParseIndent(RequireValue(args, i));
		} else if (arg == "--help" || arg == "-h") {
			opts.show_help = true;
		} else {
			throw CliUsageError("Unknown argument '" + arg + "'");
		}
	}

	if (opts.show_help) {
		return opts;
	}
	if (opts.costs_path.empty() || opts.loans_path.empty() || opts.kpis_path.empty()) {
		throw CliUsageError("--costs, --loans and --kpis are required");
	}
	if (!opts.log_level.empty()) {
		try {
			Tracer::ParseLevel(opts.log_level);
		} catch (const std::invalid_argument &e) {
			throw CliUsageError(e.what());
		}
	}
	return opts;
}

int RunCli(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
	CliOptions cli;
	try {
		cli = ParseCliArguments(args);
	} catch (const CliUsageError &e) {
		err << "Error: " << e.what() << "\n\n" << CliUsage();
		return EXIT_USAGE_ERROR;
	}

	if (cli.show_help) {
		out << CliUsage();
		return EXIT_OK;
	}

	if (!cli.log_level.empty()) {
		Tracer::SetLogLevel(Tracer::ParseLevel(cli.log_level));
	}

	try {
		DetectionOptions options =
		    cli.config_path.empty() ? DetectionOptions::Defaults() : LoadDetectionOptions(cli.config_path);
		RISKSCAN_DEBUG("Effective options: " << DetectionOptionsToJson(options).dump());

		Table costs = bridge::CsvTableReader::ReadFile(cli.costs_path);
		Table loans = bridge::CsvTableReader::ReadFile(cli.loans_path);
		Table kpis = bridge::CsvTableReader::ReadFile(cli.kpis_path);
		RISKSCAN_INFO("Loaded " << costs.RowCount() << " cost records, " << loans.RowCount() << " loans, "
		                        << kpis.RowCount() << " KPI periods");

		auto report = ReportAggregator::Generate(costs, loans, kpis, options);
		out << bridge::ReportSerializer::Serialize(report, cli.indent) << '\n';
	} catch (const std::exception &e) {
		RISKSCAN_ERROR(e.what());
		err << "Error: " << e.what() << '\n';
		return EXIT_RUNTIME_ERROR;
	}
	return EXIT_OK;
}

} // namespace riskscan
