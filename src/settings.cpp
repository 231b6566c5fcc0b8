#include "settings.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <filesystem>
#include <algorithm>
#include <locale>

namespace ferry {

namespace {

std::string escape_json(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    return out;
}

bool is_number(const std::string& value) {
    if (value.empty()) return false;
    size_t start = (value[0] == '-') ? 1 : 0;
    if (start == value.size()) return false;
    bool seen_dot = false;
    for (size_t i = start; i < value.size(); ++i) {
        if (value[i] == '.' && !seen_dot) {
            seen_dot = true;
        } else if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

SettingsManager::SettingsManager() {
    config_path_ = get_config_dir() + "/settings.json";
    ensure_defaults();
}

SettingsManager& SettingsManager::getInstance() {
    static SettingsManager instance;
    return instance;
}

std::string SettingsManager::get_config_dir() const {
    const char* override_dir = std::getenv("FERRY_CONFIG_DIR");
    if (override_dir && *override_dir) {
        return override_dir;
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/ferry";
    }
    return "/tmp/ferry";
}

std::string SettingsManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_path_;
}

void SettingsManager::ensure_defaults() {
    static const std::pair<const char*, const char*> defaults[] = {
        {"copy_buffer_size", "65536"},
        {"sample_interval_ms", "100"},
        {"rate_window_seconds", "5"},
        {"rate_smoothing", "0.3"},
        {"idle_eta_seconds", "5"},
        {"max_visible_notifications", "3"},
        {"max_notification_backlog", "64"},
        {"notification_duration_ms", "3500"},
        {"verify_checksums", "false"},
        {"preserve_timestamps", "true"},
        {"follow_symlinks", "true"},
        {"log_level", "info"},
        {"last_source_folder", ""},
        {"last_destination_folder", ""},
    };
    for (const auto& [key, value] : defaults) {
        if (settings_.find(key) == settings_.end()) {
            settings_[key] = value;
        }
    }
}

bool SettingsManager::load() {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = get_config_dir() + "/settings.json";
    }
    return load_from(path);
}

bool SettingsManager::load_from(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_path_ = path;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::info("[Settings] No settings file found, using defaults");
        ensure_defaults();
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!parse(buffer.str())) {
        Logger::warn("[Settings] Malformed settings file " + path + ", keeping parsed values");
    }

    ensure_defaults();
    Logger::info("[Settings] Loaded " + std::to_string(settings_.size()) + " settings");
    return true;
}

// Flat {"key": value, ...} objects only; nested values are not supported
bool SettingsManager::parse(const std::string& content) {
    size_t pos = content.find('{');
    if (pos == std::string::npos) return false;
    ++pos;

    auto skip_ws = [&]() {
        while (pos < content.size() && std::isspace(static_cast<unsigned char>(content[pos]))) ++pos;
    };
    auto read_string = [&](std::string& out) -> bool {
        if (pos >= content.size() || content[pos] != '"') return false;
        ++pos;
        out.clear();
        while (pos < content.size() && content[pos] != '"') {
            char c = content[pos++];
            if (c == '\\' && pos < content.size()) {
                char e = content[pos++];
                switch (e) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    default:  out += e; break;
                }
            } else {
                out += c;
            }
        }
        if (pos >= content.size()) return false;
        ++pos;
        return true;
    };

    for (;;) {
        skip_ws();
        if (pos >= content.size()) return false;
        if (content[pos] == '}') return true;
        if (content[pos] == ',') { ++pos; continue; }

        std::string key;
        if (!read_string(key)) return false;
        skip_ws();
        if (pos >= content.size() || content[pos] != ':') return false;
        ++pos;
        skip_ws();

        std::string value;
        if (pos < content.size() && content[pos] == '"') {
            if (!read_string(value)) return false;
        } else {
            size_t end = content.find_first_of(",}", pos);
            if (end == std::string::npos) return false;
            value = content.substr(pos, end - pos);
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
                value.pop_back();
            }
            pos = end;
        }
        settings_[key] = value;
    }
}

bool SettingsManager::save() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    auto dir = std::filesystem::path(config_path_).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::error("[Settings] Cannot create " + dir.string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(config_path_);
    if (!file.is_open()) {
        Logger::error("[Settings] Failed to open settings file for writing");
        return false;
    }

    file << "{\n";
    bool first = true;
    for (const auto& [key, value] : settings_) {
        if (!first) file << ",\n";
        first = false;

        bool is_bool = (value == "true" || value == "false");
        if (is_number(value) || is_bool) {
            file << "  \"" << escape_json(key) << "\": " << value;
        } else {
            file << "  \"" << escape_json(key) << "\": \"" << escape_json(value) << "\"";
        }
    }
    file << "\n}\n";
    file.close();

    if (!file) {
        Logger::error("[Settings] Failed writing " + config_path_);
        return false;
    }
    Logger::info("[Settings] Saved " + std::to_string(settings_.size()) + " settings");
    return true;
}

void SettingsManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();
    ensure_defaults();
}

EngineConfig SettingsManager::engine_config() const {
    EngineConfig config;

    int buffer = get_int("copy_buffer_size", 65536);
    if (buffer < 4096 || buffer > 64 * 1024 * 1024) {
        Logger::warn("[Settings] copy_buffer_size out of range, using 65536");
        buffer = 65536;
    }
    config.copy_buffer_size = static_cast<size_t>(buffer);

    int interval = get_int("sample_interval_ms", 100);
    if (interval < 100) {
        Logger::warn("[Settings] sample_interval_ms below 100, clamping");
        interval = 100;
    }
    config.sample_interval = std::chrono::milliseconds(interval);

    int window = get_int("rate_window_seconds", 5);
    if (window < 1) window = 1;
    config.rate_window = std::chrono::seconds(window);

    double alpha = get_double("rate_smoothing", 0.3);
    if (!(alpha > 0.0 && alpha <= 1.0)) {
        Logger::warn("[Settings] rate_smoothing must be in (0, 1], using 0.3");
        alpha = 0.3;
    }
    config.rate_smoothing = alpha;

    int idle = get_int("idle_eta_seconds", 5);
    if (idle < 1) idle = 1;
    config.idle_eta_threshold = std::chrono::seconds(idle);

    int visible = get_int("max_visible_notifications", 3);
    config.max_visible_notifications = static_cast<size_t>(std::max(1, visible));

    int backlog = get_int("max_notification_backlog", 64);
    config.max_notification_backlog = static_cast<size_t>(std::max(0, backlog));

    int duration = get_int("notification_duration_ms", 3500);
    config.notification_duration = std::chrono::milliseconds(std::max(500, duration));

    config.verify_checksums = get_bool("verify_checksums", false);
    config.preserve_timestamps = get_bool("preserve_timestamps", true);
    config.follow_symlinks = get_bool("follow_symlinks", true);
    return config;
}

LogLevel SettingsManager::get_log_level() const {
    return parse_log_level(get_string("log_level", "info"));
}

void SettingsManager::set_log_level(LogLevel level) {
    set_string("log_level", log_level_name(level));
}

bool SettingsManager::get_verify_checksums() const {
    return get_bool("verify_checksums", false);
}

void SettingsManager::set_verify_checksums(bool enabled) {
    set_bool("verify_checksums", enabled);
}

std::string SettingsManager::get_last_source_folder() const {
    return get_string("last_source_folder");
}

void SettingsManager::set_last_source_folder(const std::string& path) {
    set_string("last_source_folder", path);
}

std::string SettingsManager::get_last_destination_folder() const {
    return get_string("last_destination_folder");
}

void SettingsManager::set_last_destination_folder(const std::string& path) {
    set_string("last_destination_folder", path);
}

void SettingsManager::set_change_callback(SettingsChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callback_ = std::move(callback);
}

void SettingsManager::notify_change(const std::string& key) {
    SettingsChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = change_callback_;
    }
    if (callback) {
        callback(key);
    }
}

std::string SettingsManager::raw(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(key);
    return it != settings_.end() ? it->second : std::string();
}

std::string SettingsManager::get_string(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(key);
    return it != settings_.end() ? it->second : default_value;
}

void SettingsManager::set_string(const std::string& key, const std::string& value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }
    notify_change(key);
}

int SettingsManager::get_int(const std::string& key, int default_value) const {
    std::string value = raw(key);
    if (value.empty()) return default_value;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        Logger::warn("[Settings] Not an integer: " + key + "=" + value);
        return default_value;
    }
}

void SettingsManager::set_int(const std::string& key, int value) {
    set_string(key, std::to_string(value));
}

double SettingsManager::get_double(const std::string& key, double default_value) const {
    std::string value = raw(key);
    if (value.empty()) return default_value;
    // The GUI switches to the user's locale; settings always use '.'
    std::istringstream in(value);
    in.imbue(std::locale::classic());
    double parsed = 0.0;
    if (!(in >> parsed)) {
        Logger::warn("[Settings] Not a number: " + key + "=" + value);
        return default_value;
    }
    return parsed;
}

bool SettingsManager::get_bool(const std::string& key, bool default_value) const {
    std::string value = raw(key);
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0") return false;
    return default_value;
}

void SettingsManager::set_bool(const std::string& key, bool value) {
    set_string(key, value ? "true" : "false");
}

} // namespace ferry
