#pragma once

#include "libriskscan/core/detection_options.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace riskscan {

/**
 * Parse detection options from a JSON document
 *
 * Every key is optional; absent keys keep the defaults of
 * libriskscan::core::DetectionOptions. A category object ("costs", "loans",
 * "kpis") overrides only the keys it names, but a "watched_fields" or
 * "metrics" list replaces the default list as a whole.
 *
 * @param config JSON object
 * @return Validated options
 * @throws std::invalid_argument on unknown keys, wrongly-typed values or
 *         values rejected by DetectionOptions::Validate()
 */
libriskscan::core::DetectionOptions ParseDetectionOptions(const nlohmann::json &config);

/**
 * Parse detection options from JSON text
 *
 * @throws std::invalid_argument if the text is not valid JSON or the options are invalid
 */
libriskscan::core::DetectionOptions ParseDetectionOptionsText(const std::string &text);

/**
 * Load detection options from a JSON file
 *
 * @param path Path to the configuration file
 * @throws std::runtime_error if the file cannot be read
 * @throws std::invalid_argument if its content is invalid
 */
libriskscan::core::DetectionOptions LoadDetectionOptions(const std::string &path);

/**
 * Options as a JSON object using the same keys the parser accepts
 */
nlohmann::json DetectionOptionsToJson(const libriskscan::core::DetectionOptions &options);

} // namespace riskscan
