#pragma once

#include <string>
#include <memory>

namespace voicekit {

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
 * @brief Lightweight, thread-safe logging system
 *
 * Provides structured logging with levels and optional file output.
 * Safe to call from the coordination thread, engine workers and the
 * PortAudio callback (the latter only at DEBUG and only on state changes).
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

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return Parsed level, or INFO for unrecognized names
     */
    static LogLevel level_from_string(const std::string& name);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Component-specific logging macros
#define LOG_SESSION(msg) voicekit::Logger::info(std::string("[Session] ") + (msg))
#define LOG_ROUTING(msg) voicekit::Logger::debug(std::string("[Routing] ") + (msg))
#define LOG_TAP(msg) voicekit::Logger::debug(std::string("[Tap] ") + (msg))
#define LOG_AUDIO(msg) voicekit::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_STT(msg) voicekit::Logger::info(std::string("[STT] ") + (msg))

} // namespace voicekit
