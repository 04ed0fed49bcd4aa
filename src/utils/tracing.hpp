#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace riskscan {

/**
 * @brief Process-wide logger for the riskscan tools
 *
 * All output goes to stderr so stdout stays reserved for the JSON report.
 * Lines look like
 *
 *   [2024-11-05 09:14:02.118] [riskscan/WARN] report_aggregator.cpp:88 - KPIs: metric 'net_margin' ...
 *
 * The level comes from RISKSCAN_LOG_LEVEL (trace, debug, info, warn, error,
 * none) unless SetLogLevel() is called first; the CLI calls it for
 * --log-level. Release builds default to warn, debug builds to info.
 *
 * Example usage:
 *   RISKSCAN_DEBUG("Scoring " << rows << " cost records");
 *   RISKSCAN_TIMING_START();
 *   // ... do work ...
 *   RISKSCAN_TIMING_END("Cost detection");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/// Apply RISKSCAN_LOG_LEVEL once; unknown values keep the build default
	static void Initialize();

	static void SetLogLevel(LogLevel level);
	static LogLevel GetLogLevel();

	/// True when `level` is enabled; NONE is never written
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @return Matching LogLevel
	 * @throws std::invalid_argument for an unknown name
	 */
	static LogLevel ParseLevel(const std::string &name);

	/**
	 * @brief Write one line tagged with the source location
	 *
	 * @param level Message level
	 * @param file Source path; only the file name is printed
	 * @param line Source line
	 * @param message Preformatted text
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	/// Write one line without a source location
	static void LogDirect(LogLevel level, const std::string &message);

	/// INFO banner framing a report phase, e.g. "ANOMALY DETECTION"
	static void Section(const std::string &title);

	/// Upper-case display name ("DEBUG", "ERROR", ...)
	static std::string GetLevelName(LogLevel level);

	/// Local time with milliseconds
	static std::string GetTimestamp();

	/// Steady-clock tick count to pass to TimingEnd()
	static uint64_t TimingStart();

	/**
	 * @brief Log "<operation> completed in N ms" at DEBUG
	 *
	 * @param handle Value returned by TimingStart()
	 * @param operation_name Label for the log line
	 * @return Elapsed milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static bool TryParseLevel(const std::string &name, LogLevel &level);
	static LogLevel DefaultLevel();
	static void Emit(LogLevel level, const std::string &text);

	static LogLevel current_level_;
	static bool initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Logging macros
// ============================================================================

/**
 * @brief Log `msg` (stream syntax) at `level` with the caller's file and line
 *
 * The message is only formatted when the level is enabled.
 */
#define RISKSCAN_LOG(level, msg)                                                                                       \
	do {                                                                                                               \
		if (riskscan::Tracer::ShouldLog(level)) {                                                                      \
			std::ostringstream riskscan_log_stream_;                                                                   \
			riskscan_log_stream_ << msg;                                                                               \
			riskscan::Tracer::Log(level, __FILE__, __LINE__, riskscan_log_stream_.str());                              \
		}                                                                                                              \
	} while (0)

#define RISKSCAN_TRACE(msg) RISKSCAN_LOG(riskscan::LogLevel::TRACE, msg)
#define RISKSCAN_DEBUG(msg) RISKSCAN_LOG(riskscan::LogLevel::DBG, msg)
#define RISKSCAN_INFO(msg)  RISKSCAN_LOG(riskscan::LogLevel::INFO, msg)
#define RISKSCAN_WARN(msg)  RISKSCAN_LOG(riskscan::LogLevel::WARN, msg)
#define RISKSCAN_ERROR(msg) RISKSCAN_LOG(riskscan::LogLevel::ERR, msg)

/**
 * @brief Scoped timing; START declares the handle that END reads
 *
 * Usage:
 *   RISKSCAN_TIMING_START();
 *   // ... do work ...
 *   RISKSCAN_TIMING_END("Loan detection");
 */
#define RISKSCAN_TIMING_START() const uint64_t riskscan_timing_handle_ = riskscan::Tracer::TimingStart()

#define RISKSCAN_TIMING_END(operation_name) riskscan::Tracer::TimingEnd(riskscan_timing_handle_, operation_name)

} // namespace riskscan
