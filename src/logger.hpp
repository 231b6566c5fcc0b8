#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace ferry {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Process-wide logger.
 *
 * Lines go to stdout (time only) and, once init() was given a path,
 * to an append-mode log file (full date).
 */
class Logger {
public:
    static void init(LogLevel level, const std::string& log_file_path = "");
    static void shutdown();
    static void log(LogLevel level, const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel level();

    // Tests and the CLI progress line turn the console stream off
    static void set_console_enabled(bool enabled);

    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warn(const std::string& message) { log(LogLevel::WARN, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }

    // Default log file location (~/.cache/ferry/ferry.log)
    static std::string default_log_path();

private:
    static LogLevel current_level;
    static bool console_enabled;
    static std::ofstream log_file;
    static std::mutex log_mutex;
};

// Accepts "debug", "info", "warn"/"warning", "error"; anything else is INFO
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

} // namespace ferry
