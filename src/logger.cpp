#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace macfence {

// Initialize static members
std::atomic<LogLevel> Logger::current_log_level_{LogLevel::Info};
std::ostream* Logger::info_stream_ = &std::cout;

namespace {
std::mutex log_mutex;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (level == LogLevel::None || level > current_log_level_.load()) {
        return;
    }

    // Get current timestamp
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream timestamp;
    timestamp << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    timestamp << '.' << std::setfill('0') << std::setw(3) << ms.count();

    // Level prefix
    std::string level_str;
    bool to_stderr = false;

    switch (level) {
        case LogLevel::Error:
            level_str = "ERROR";
            to_stderr = true;
            break;
        case LogLevel::Warning:
            level_str = "WARN ";
            to_stderr = true;
            break;
        case LogLevel::Info:
            level_str = "INFO ";
            break;
        case LogLevel::Debug:
            level_str = "DEBUG";
            break;
        case LogLevel::None:
            return; // Don't log anything
    }

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ostream* output_stream = to_stderr ? &std::cerr : info_stream_;
    *output_stream << "[" << timestamp.str() << "] [" << level_str << "] " << component << ": "
                   << message << std::endl;
}

void Logger::error(const std::string& component, const std::string& message) {
    log(LogLevel::Error, component, message);
}

void Logger::warning(const std::string& component, const std::string& message) {
    log(LogLevel::Warning, component, message);
}

void Logger::info(const std::string& component, const std::string& message) {
    log(LogLevel::Info, component, message);
}

void Logger::debug(const std::string& component, const std::string& message) {
    log(LogLevel::Debug, component, message);
}

void Logger::setLogLevel(LogLevel level) {
    LogLevel oldLevel = current_log_level_.exchange(level);

    log(LogLevel::Debug, "Logger", "Log level changed from " + logLevelToString(oldLevel) +
                                   " to " + logLevelToString(level));
}

LogLevel Logger::getLogLevel() {
    return current_log_level_.load();
}

void Logger::setInfoStream(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(log_mutex);
    info_stream_ = &stream;
}

std::string Logger::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::None:
            return "NONE";
        default:
            return "UNKNOWN";
    }
}

bool Logger::parseLogLevel(const std::string& name, LogLevel& level) {
    std::string value = name;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "none" || value == "off") {
        level = LogLevel::None;
    } else if (value == "error") {
        level = LogLevel::Error;
    } else if (value == "warning" || value == "warn") {
        level = LogLevel::Warning;
    } else if (value == "info") {
        level = LogLevel::Info;
    } else if (value == "debug") {
        level = LogLevel::Debug;
    } else {
        return false;
    }
    return true;
}

} // namespace macfence
