#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace liblinreg {
namespace utils {

/**
 * @brief Leveled logging and timing for liblinreg
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error, none)
 * - Stream-syntax macros tagged with file/line
 * - Timing measurements for fit routines
 * - Thread-safe output to stderr
 *
 * Control via environment variable: LINREG_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   LINREG_DEBUG("Fitting " << n << " observations");
 *   LINREG_TIMING_START();
 *   // ... do work ...
 *   LINREG_TIMING_END("FitMultiple");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

/**
 * @brief Parse a level name (case-insensitive)
 *
 * @param name Level name as accepted in LINREG_LOG_LEVEL
 * @param fallback Level returned for unrecognized names
 */
LogLevel ParseLogLevel(const std::string &name, LogLevel fallback);

class Tracer {
public:
	/// Reads LINREG_LOG_LEVEL once; later calls are no-ops
	static void Initialize();

	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	static bool ShouldLog(LogLevel level);

	/// Build-type default: WARN for release, INFO otherwise
	static LogLevel DefaultLevel();

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name (directory part is stripped)
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log its duration at debug level
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel current_level_;
	static bool initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

} // namespace utils
} // namespace liblinreg

#define LINREG_LOG_AT(level, msg)                                                                                      \
	do {                                                                                                               \
		if (liblinreg::utils::Tracer::ShouldLog(level)) {                                                              \
			std::ostringstream linreg_oss_;                                                                            \
			linreg_oss_ << msg;                                                                                        \
			liblinreg::utils::Tracer::Log(level, __FILE__, __LINE__, linreg_oss_.str());                               \
		}                                                                                                              \
	} while (0)

#define LINREG_TRACE(msg) LINREG_LOG_AT(liblinreg::utils::LogLevel::TRACE, msg)
#define LINREG_DEBUG(msg) LINREG_LOG_AT(liblinreg::utils::LogLevel::DBG, msg)
#define LINREG_INFO(msg)  LINREG_LOG_AT(liblinreg::utils::LogLevel::INFO, msg)
#define LINREG_WARN(msg)  LINREG_LOG_AT(liblinreg::utils::LogLevel::WARN, msg)
#define LINREG_ERROR(msg) LINREG_LOG_AT(liblinreg::utils::LogLevel::ERR, msg)

#define LINREG_TIMING_START() uint64_t linreg_timing_handle_ = liblinreg::utils::Tracer::TimingStart()

#define LINREG_TIMING_END(operation_name) liblinreg::utils::Tracer::TimingEnd(linreg_timing_handle_, operation_name)
