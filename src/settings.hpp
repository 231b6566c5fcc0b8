#pragma once

#include <string>
#include <map>
#include <mutex>
#include <functional>

#include "engine_config.hpp"
#include "logger.hpp"

namespace ferry {

/**
 * Application Settings Manager
 *
 * Flat key/value settings persisted as a JSON object in
 * ~/.config/ferry/settings.json ($FERRY_CONFIG_DIR overrides the folder).
 * Missing keys are filled with defaults on load.
 */
class SettingsManager {
public:
    static SettingsManager& getInstance();

    // Load/save settings
    bool load();
    bool load_from(const std::string& path);
    bool save();

    // Engine tunables, clamped to usable ranges
    EngineConfig engine_config() const;

    LogLevel get_log_level() const;
    void set_log_level(LogLevel level);

    bool get_verify_checksums() const;
    void set_verify_checksums(bool enabled);

    // Remembered by the window between runs
    std::string get_last_source_folder() const;
    void set_last_source_folder(const std::string& path);
    std::string get_last_destination_folder() const;
    void set_last_destination_folder(const std::string& path);

    // Settings change callback
    using SettingsChangeCallback = std::function<void(const std::string& key)>;
    void set_change_callback(SettingsChangeCallback callback);

    // Generic getters/setters
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    void set_string(const std::string& key, const std::string& value);

    int get_int(const std::string& key, int default_value = 0) const;
    void set_int(const std::string& key, int value);

    double get_double(const std::string& key, double default_value = 0.0) const;

    bool get_bool(const std::string& key, bool default_value = false) const;
    void set_bool(const std::string& key, bool value);

    // Drop every value and return to defaults (does not touch the file)
    void reset();

    std::string get_config_dir() const;
    std::string get_config_path() const;

private:
    SettingsManager();
    ~SettingsManager() = default;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    void notify_change(const std::string& key);
    void ensure_defaults();
    bool parse(const std::string& content);
    std::string raw(const std::string& key) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> settings_;
    std::string config_path_;
    SettingsChangeCallback change_callback_;
};

} // namespace ferry
