/**
 * @file test_settings.cpp
 * @brief Unit tests for SettingsManager persistence and EngineConfig clamping
 */

#include "test_harness.hpp"

#include "settings.hpp"

using namespace ferry;

TEST(defaults_without_file) {
    TempDir dir;
    auto& s = SettingsManager::getInstance();
    s.reset();
    ASSERT(!s.load_from(dir / "settings.json"));

    EngineConfig c = s.engine_config();
    ASSERT_EQ(c.copy_buffer_size, 65536u);
    ASSERT_EQ(c.sample_interval.count(), 100);
    ASSERT_EQ(c.rate_window.count(), 5000);
    ASSERT_EQ(c.rate_smoothing, 0.3);
    ASSERT_EQ(c.idle_eta_threshold.count(), 5000);
    ASSERT_EQ(c.max_visible_notifications, 3u);
    ASSERT_EQ(c.max_notification_backlog, 64u);
    ASSERT_EQ(c.notification_duration.count(), 3500);
    ASSERT(!c.verify_checksums);
    ASSERT(c.preserve_timestamps);
    ASSERT(c.follow_symlinks);
    ASSERT(s.get_log_level() == LogLevel::INFO);
}

TEST(save_and_reload_round_trip) {
    TempDir dir;
    std::string path = dir / "nested/settings.json";
    auto& s = SettingsManager::getInstance();
    s.reset();
    s.load_from(path);

    s.set_last_source_folder("/home/user/Photos \"2024\"");
    s.set_verify_checksums(true);
    s.set_int("max_visible_notifications", 5);
    s.set_log_level(LogLevel::DEBUG);
    ASSERT(s.save());

    s.reset();
    ASSERT(s.load_from(path));
    ASSERT_EQ(s.get_last_source_folder(), "/home/user/Photos \"2024\"");
    ASSERT(s.get_verify_checksums());
    ASSERT_EQ(s.engine_config().max_visible_notifications, 5u);
    ASSERT(s.get_log_level() == LogLevel::DEBUG);

    std::string raw = read_file(path);
    ASSERT(raw.find("\"verify_checksums\": true") != std::string::npos);
    ASSERT(raw.find("\"max_visible_notifications\": 5") != std::string::npos);
}

TEST(out_of_range_values_are_clamped) {
    TempDir dir;
    std::string path = dir / "settings.json";
    write_file(path,
               "{\n"
               "  \"copy_buffer_size\": 12,\n"
               "  \"sample_interval_ms\": 5,\n"
               "  \"rate_smoothing\": 7.5,\n"
               "  \"max_visible_notifications\": 0,\n"
               "  \"notification_duration_ms\": 10\n"
               "}\n");

    auto& s = SettingsManager::getInstance();
    s.reset();
    ASSERT(s.load_from(path));

    EngineConfig c = s.engine_config();
    ASSERT_EQ(c.copy_buffer_size, 65536u);
    ASSERT_EQ(c.sample_interval.count(), 100);
    ASSERT_EQ(c.rate_smoothing, 0.3);
    ASSERT_EQ(c.max_visible_notifications, 1u);
    ASSERT_EQ(c.notification_duration.count(), 500);
}

TEST(malformed_values_fall_back) {
    TempDir dir;
    std::string path = dir / "settings.json";
    write_file(path, "{ \"rate_window_seconds\": \"soon\", \"follow_symlinks\": \"maybe\" }");

    auto& s = SettingsManager::getInstance();
    s.reset();
    ASSERT(s.load_from(path));
    EngineConfig c = s.engine_config();
    ASSERT_EQ(c.rate_window.count(), 5000);
    ASSERT(c.follow_symlinks);
}

TEST(change_callback_fires) {
    TempDir dir;
    auto& s = SettingsManager::getInstance();
    s.reset();
    s.load_from(dir / "settings.json");

    std::string changed;
    s.set_change_callback([&changed](const std::string& key) { changed = key; });
    s.set_last_destination_folder("/mnt/backup");
    s.set_change_callback(nullptr);

    ASSERT_EQ(changed, "last_destination_folder");
    ASSERT_EQ(s.get_last_destination_folder(), "/mnt/backup");
}

TEST(config_dir_override) {
    setenv("FERRY_CONFIG_DIR", "/tmp/ferry-config-test", 1);
    ASSERT_EQ(SettingsManager::getInstance().get_config_dir(), "/tmp/ferry-config-test");
    unsetenv("FERRY_CONFIG_DIR");
}

int main() {
    quiet_logging();
    printf("Running settings tests...\n");

    RUN_TEST(defaults_without_file);
    RUN_TEST(save_and_reload_round_trip);
    RUN_TEST(out_of_range_values_are_clamped);
    RUN_TEST(malformed_values_fall_back);
    RUN_TEST(change_callback_fires);
    RUN_TEST(config_dir_override);

    TEST_SUMMARY();
}
