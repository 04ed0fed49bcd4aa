#include "options_parser.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace riskscan {

using libriskscan::core::CrossSectionalSpec;
using libriskscan::core::DetectionOptions;
using libriskscan::core::TimeSeriesSpec;
using libriskscan::core::WatchedField;
using nlohmann::json;

namespace {

void RequireObject(const json &value, const std::string &key) {
	if (!value.is_object()) {
		throw std::invalid_argument("Option '" + key + "' must be a JSON object");
	}
}

std::string GetString(const json &value, const std::string &key) {
	if (!value.is_string()) {
		throw std::invalid_argument("Option '" + key + "' must be a string");
	}
	return value.get<std::string>();
}

double GetNumber(const json &value, const std::string &key) {
	if (!value.is_number()) {
		throw std::invalid_argument("Option '" + key + "' must be a number");
	}
	return value.get<double>();
}

size_t GetCount(const json &value, const std::string &key) {
	// Negative integers parse as number_integer, fractions as number_float
	if (!value.is_number_unsigned()) {
		throw std::invalid_argument("Option '" + key + "' must be a non-negative integer");
	}
	return value.get<size_t>();
}

WatchedField ParseWatchedField(const json &value, const std::string &key) {
	RequireObject(value, key);

	std::string column;
	std::string label;
	std::string score_column;
	for (auto it = value.begin(); it != value.end(); ++it) {
		const std::string child = key + "." + it.key();
		if (it.key() == "column") {
			column = GetString(it.value(), child);
		} else if (it.key() == "label") {
			label = GetString(it.value(), child);
		} else if (it.key() == "score_column") {
			score_column = GetString(it.value(), child);
		} else {
			throw std::invalid_argument("Unknown option: '" + child +
			                            "'. Valid options are: column, label, score_column");
		}
	}
	if (column.empty()) {
		throw std::invalid_argument("Option '" + key + ".column' is required");
	}
	if (label.empty()) {
		throw std::invalid_argument("Option '" + key + ".label' is required");
	}
	return WatchedField::Make(std::move(column), std::move(label), std::move(score_column));
}

void ParseCrossSectional(const json &value, const std::string &key, CrossSectionalSpec &spec) {
	RequireObject(value, key);

	for (auto it = value.begin(); it != value.end(); ++it) {
		const std::string child = key + "." + it.key();
		if (it.key() == "id_column") {
			spec.id_column = GetString(it.value(), child);
		} else if (it.key() == "group_column") {
			spec.group_column = GetString(it.value(), child);
		} else if (it.key() == "magnitude_column") {
			spec.magnitude_column = GetString(it.value(), child);
		} else if (it.key() == "watched_fields") {
			if (!it.value().is_array()) {
				throw std::invalid_argument("Option '" + child + "' must be an array");
			}
			std::vector<WatchedField> fields;
			for (size_t i = 0; i < it.value().size(); i++) {
				fields.push_back(ParseWatchedField(it.value()[i], child + "[" + std::to_string(i) + "]"));
			}
			spec.watched_fields = std::move(fields);
		} else {
			throw std::invalid_argument("Unknown option: '" + child +
			                            "'. Valid options are: id_column, group_column, magnitude_column, "
			                            "watched_fields");
		}
	}
}

void ParseTimeSeries(const json &value, const std::string &key, TimeSeriesSpec &spec) {
	RequireObject(value, key);

	for (auto it = value.begin(); it != value.end(); ++it) {
		const std::string child = key + "." + it.key();
		if (it.key() == "period_column") {
			spec.period_column = GetString(it.value(), child);
		} else if (it.key() == "metrics") {
			if (!it.value().is_array()) {
				throw std::invalid_argument("Option '" + child + "' must be an array");
			}
			std::vector<std::string> metrics;
			for (size_t i = 0; i < it.value().size(); i++) {
				metrics.push_back(GetString(it.value()[i], child + "[" + std::to_string(i) + "]"));
			}
			spec.metrics = std::move(metrics);
		} else {
			throw std::invalid_argument("Unknown option: '" + child +
			                            "'. Valid options are: period_column, metrics");
		}
	}
}

json CrossSectionalToJson(const CrossSectionalSpec &spec) {
	json fields = json::array();
	for (const auto &field : spec.watched_fields) {
		fields.push_back({{"column", field.column}, {"label", field.label}, {"score_column", field.score_column}});
	}
	return {{"id_column", spec.id_column},
	        {"group_column", spec.group_column},
	        {"magnitude_column", spec.magnitude_column},
	        {"watched_fields", fields}};
}

} // namespace

DetectionOptions ParseDetectionOptions(const json &config) {
	DetectionOptions opts;

	// Return defaults if no options provided
	if (config.is_null()) {
		return opts;
	}
	RequireObject(config, "<root>");

	for (auto it = config.begin(); it != config.end(); ++it) {
		const std::string &key = it.key();
		if (key == "threshold") {
			opts.threshold = GetNumber(it.value(), key);
		} else if (key == "window_cap") {
			opts.window_cap = GetCount(it.value(), key);
		} else if (key == "top_n") {
			opts.top_n = GetCount(it.value(), key);
		} else if (key == "costs") {
			ParseCrossSectional(it.value(), key, opts.costs);
		} else if (key == "loans") {
			ParseCrossSectional(it.value(), key, opts.loans);
		} else if (key == "kpis") {
			ParseTimeSeries(it.value(), key, opts.kpis);
		} else {
			throw std::invalid_argument("Unknown option: '" + key +
			                            "'. Valid options are: threshold, window_cap, top_n, costs, loans, kpis");
		}
	}

	opts.Validate();
	return opts;
}

DetectionOptions ParseDetectionOptionsText(const std::string &text) {
	json config;
	try {
		config = json::parse(text);
	} catch (const json::parse_error &e) {
		throw std::invalid_argument(std::string("Invalid configuration JSON: ") + e.what());
	}
	return ParseDetectionOptions(config);
}

DetectionOptions LoadDetectionOptions(const std::string &path) {
	std::ifstream in(path);
	if (!in) {
		throw std::runtime_error("Cannot open configuration file '" + path + "'");
	}
	std::ostringstream buffer;
	buffer << in.rdbuf();
	try {
		return ParseDetectionOptionsText(buffer.str());
	} catch (const std::invalid_argument &e) {
		throw std::invalid_argument(path + ": " + e.what());
	}
}

json DetectionOptionsToJson(const DetectionOptions &options) {
	return {{"threshold", options.threshold},
	        {"window_cap", options.window_cap},
	        {"top_n", options.top_n},
	        {"costs", CrossSectionalToJson(options.costs)},
	        {"loans", CrossSectionalToJson(options.loans)},
	        {"kpis", {{"period_column", options.kpis.period_column}, {"metrics", options.kpis.metrics}}}};
}

} // namespace riskscan
