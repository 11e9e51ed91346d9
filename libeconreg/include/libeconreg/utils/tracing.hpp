#pragma once

#include <cstdint>
#include <string>
#include <iostream>
#include <sstream>

namespace libeconreg {
namespace utils {

/**
 * @brief Configurable logging for the estimators
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error)
 * - Timestamped lines with file/line info on stderr
 * - Timing measurements
 * - Environment variable control
 * - Thread-safe output
 *
 * Control via environment variable: ECONREG_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * The level is read once and stored atomically, so estimators may log
 * from several threads at once.
 *
 * Example usage:
 *   ECONREG_DEBUG("OLS fit: T=" << T << " k=" << k);
 *   ECONREG_TIMING_START();
 *   // ... do work ...
 *   ECONREG_TIMING_END("Driscoll-Kraay covariance");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Read ECONREG_LOG_LEVEL (first call only, thread-safe)
	 */
	static void Initialize();

	/**
	 * @brief Set global log level (overrides the environment)
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log its duration at DEBUG
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define ECONREG_LOG_AT(level, msg)                                                                                     \
	do {                                                                                                               \
		if (libeconreg::utils::Tracer::ShouldLog(level)) {                                                             \
			std::ostringstream econreg_oss;                                                                            \
			econreg_oss << msg;                                                                                        \
			libeconreg::utils::Tracer::Log(level, __FILE__, __LINE__, econreg_oss.str());                              \
		}                                                                                                              \
	} while (0)

/// Usage: ECONREG_TRACE(message << stream << contents)
#define ECONREG_TRACE(msg) ECONREG_LOG_AT(libeconreg::utils::LogLevel::TRACE, msg)

#define ECONREG_DEBUG(msg) ECONREG_LOG_AT(libeconreg::utils::LogLevel::DBG, msg)

#define ECONREG_INFO(msg) ECONREG_LOG_AT(libeconreg::utils::LogLevel::INFO, msg)

#define ECONREG_WARN(msg) ECONREG_LOG_AT(libeconreg::utils::LogLevel::WARN, msg)

#define ECONREG_ERROR(msg) ECONREG_LOG_AT(libeconreg::utils::LogLevel::ERR, msg)

/**
 * @brief Macros for timing operations
 *
 * Usage:
 *   ECONREG_TIMING_START();
 *   // ... do work ...
 *   ECONREG_TIMING_END("Operation name");
 */
#define ECONREG_TIMING_START() uint64_t econreg_timing_handle = libeconreg::utils::Tracer::TimingStart()

#define ECONREG_TIMING_END(operation_name) libeconreg::utils::Tracer::TimingEnd(econreg_timing_handle, operation_name)

} // namespace utils
} // namespace libeconreg
