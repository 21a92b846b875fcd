#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace saberstat {

/**
 * @brief Leveled logging for the analysis driver
 *
 * Messages go to stderr as
 *   [2024-05-01 10:00:00.123] [saberstat/WARN] analysis_pipeline.cpp:42 - message
 *
 * Control via environment variable: SABERSTAT_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 * Default: warn in release builds, info in debug builds
 *
 * Example usage:
 *   SABERSTAT_INFO("Canonicalized " << n << " records");
 *   SABERSTAT_TIMING_START();
 *   // ... stage ...
 *   SABERSTAT_TIMING_END("aggregation");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Read SABERSTAT_LOG_LEVEL once
	 *
	 * An unrecognized value keeps the build default. Safe to call from any
	 * thread; a level set by SetLogLevel() is never overwritten.
	 */
	static void Initialize();

	/// Overrides the environment
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @throws std::invalid_argument for any other name
	 */
	static LogLevel ParseLevel(const std::string &name);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file (directory part is stripped)
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	/// Log without location
	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	/**
	 * @brief Start a timed stage
	 *
	 * @return Opaque handle for TimingEnd()
	 */
	static uint64_t TimingStart();

	/**
	 * @brief Log the stage duration at debug level
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &stage_name);

private:
	static void ReadEnvironment();

	static std::atomic<LogLevel> current_level_;
	static std::atomic<bool> initialized_;
	static std::once_flag init_flag_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

/**
 * @brief Stream-syntax logging at an explicit level
 *
 * Usage: SABERSTAT_LOG(saberstat::LogLevel::INFO, "n=" << n)
 */
#define SABERSTAT_LOG(level, msg)                                                                                      \
	do {                                                                                                               \
		if (saberstat::Tracer::ShouldLog(level)) {                                                                     \
			std::ostringstream saberstat_log_oss;                                                                      \
			saberstat_log_oss << msg;                                                                                  \
			saberstat::Tracer::Log(level, __FILE__, __LINE__, saberstat_log_oss.str());                                \
		}                                                                                                              \
	} while (0)

#define SABERSTAT_TRACE(msg) SABERSTAT_LOG(saberstat::LogLevel::TRACE, msg)
#define SABERSTAT_DEBUG(msg) SABERSTAT_LOG(saberstat::LogLevel::DBG, msg)
#define SABERSTAT_INFO(msg)  SABERSTAT_LOG(saberstat::LogLevel::INFO, msg)
#define SABERSTAT_WARN(msg)  SABERSTAT_LOG(saberstat::LogLevel::WARN, msg)
#define SABERSTAT_ERROR(msg) SABERSTAT_LOG(saberstat::LogLevel::ERR, msg)

/**
 * @brief Stage timing
 *
 * Usage:
 *   SABERSTAT_TIMING_START();
 *   // ... do work ...
 *   SABERSTAT_TIMING_END("Stage name");
 */
#define SABERSTAT_TIMING_START() uint64_t saberstat_timing_handle = saberstat::Tracer::TimingStart()

#define SABERSTAT_TIMING_END(stage_name) saberstat::Tracer::TimingEnd(saberstat_timing_handle, stage_name)

} // namespace saberstat
