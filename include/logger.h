#pragma once

#include <string>
#include <memory>

namespace vortex_l0 {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive).
 * Unknown strings yield INFO.
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Process-wide, thread-safe logger
 *
 * Registry diagnostics (validation failures, duplicate names), routing
 * decisions and outbound memory-service calls all go through here.
 * Messages logged before initialize() or after shutdown() are written to
 * the console as-is, DEBUG dropped. WARN and ERROR go to stderr so that
 * stdout carries only program output when the level is WARN or higher.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                           const std::string& output_file = "");

    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

private:
    class Impl;
    static Impl& instance();

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) vortex_l0::Logger::debug(msg)
#define LOG_INFO(msg) vortex_l0::Logger::info(msg)
#define LOG_WARN(msg) vortex_l0::Logger::warn(msg)
#define LOG_ERROR(msg) vortex_l0::Logger::error(msg)

// Component-specific logging macros
#define LOG_REGISTRY(msg) vortex_l0::Logger::info(std::string("[Registry] ") + (msg))
#define LOG_ROUTER(msg) vortex_l0::Logger::debug(std::string("[Router] ") + (msg))
#define LOG_MEMORY(msg) vortex_l0::Logger::info(std::string("[Memory] ") + (msg))
#define LOG_HTTP(msg) vortex_l0::Logger::debug(std::string("[HTTP] ") + (msg))

} // namespace vortex_l0
