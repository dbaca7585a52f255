/**
 * @file logger.hpp
 * @brief Process-wide leveled logging for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * This file contains the Logger class used by every macfence component to
 * report progress, best-effort failures and errors. Messages carry a
 * millisecond timestamp, a level tag and the name of the emitting component.
 */

#pragma once

#include <atomic>
#include <ostream>
#include <string>

namespace macfence {

/**
 * @enum LogLevel
 * @brief Logging levels for macfence components
 *
 * Controls the verbosity of logging:
 * - None: No logging output
 * - Error: Only error messages
 * - Warning: Errors and warnings
 * - Info: Errors, warnings, and informational messages
 * - Debug: All messages including detailed execution information
 */
enum class LogLevel {
    None,    ///< No logging
    Error,   ///< Error messages only
    Warning, ///< Error and warning messages
    Info,    ///< Informational messages and above
    Debug    ///< All messages including debug information
};

/**
 * @class Logger
 * @brief Static leveled logger shared by all components
 *
 * Errors and warnings are written to the error stream (stderr by default),
 * informational and debug messages to the info stream (stdout by default).
 * The command line tool redirects the info stream to stderr so that stdout
 * only carries command output.
 */
class Logger {
public:
    /**
     * @brief Log a message at the specified level
     * @param level Log level for the message
     * @param component Name of the emitting component (e.g. "Reconciler")
     * @param message Message content to log
     *
     * Messages above the current level are discarded.
     */
    static void log(LogLevel level, const std::string& component, const std::string& message);

    static void error(const std::string& component, const std::string& message);
    static void warning(const std::string& component, const std::string& message);
    static void info(const std::string& component, const std::string& message);
    static void debug(const std::string& component, const std::string& message);

    /**
     * @brief Set the global logging level
     * @param level Logging level to set
     */
    static void setLogLevel(LogLevel level);

    /**
     * @brief Get current logging level
     * @return Current logging level
     */
    static LogLevel getLogLevel();

    /**
     * @brief Redirect informational and debug output
     * @param stream Stream that receives Info and Debug messages
     */
    static void setInfoStream(std::ostream& stream);

    /**
     * @brief Convert LogLevel enum to string representation
     * @param level LogLevel enum value
     * @return Upper-case level name ("ERROR", "WARNING", ...)
     */
    static std::string logLevelToString(LogLevel level);

    /**
     * @brief Parse a level name as used in configuration files
     * @param name Case-insensitive level name ("none", "error", "warning", "warn", "info", "debug")
     * @param level Output level
     * @return true if the name was recognized
     */
    static bool parseLogLevel(const std::string& name, LogLevel& level);

private:
    static std::atomic<LogLevel> current_log_level_; ///< Current global logging level
    static std::ostream* info_stream_;  ///< Info and Debug destination, guarded by the log mutex
};

} // namespace macfence
