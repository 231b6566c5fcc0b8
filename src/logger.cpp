#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace ferry {

LogLevel Logger::current_level = LogLevel::INFO;
bool Logger::console_enabled = true;
std::ofstream Logger::log_file;
std::mutex Logger::log_mutex;

void Logger::init(LogLevel level, const std::string& log_file_path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
    if (log_file.is_open()) {
        log_file.close();
    }
    if (!log_file_path.empty()) {
        std::error_code ec;
        auto parent = std::filesystem::path(log_file_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        log_file.open(log_file_path, std::ios::app);
        if (!log_file.is_open()) {
            std::cerr << "[Logger] Could not open log file: " << log_file_path << std::endl;
        }
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.flush();
        log_file.close();
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return current_level;
}

void Logger::set_console_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex);
    console_enabled = enabled;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < current_level) return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG: level_str = "[DEBUG]"; break;
        case LogLevel::INFO:  level_str = "[INFO] "; break;
        case LogLevel::WARN:  level_str = "[WARN] "; break;
        case LogLevel::ERROR: level_str = "[ERROR]"; break;
    }

    if (log_file.is_open()) {
        log_file << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
                 << " " << level_str << " " << message << std::endl;
    }

    if (console_enabled) {
        std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        out << std::put_time(&local_tm, "%H:%M:%S")
            << " " << level_str << " " << message << std::endl;
    }
}

std::string Logger::default_log_path() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.cache/ferry/ferry.log";
    }
    return "/tmp/ferry.log";
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

} // namespace ferry
