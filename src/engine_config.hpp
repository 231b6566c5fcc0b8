#pragma once

#include <chrono>
#include <cstddef>

namespace ferry {

/**
 * Tunables for one TransferEngine. SettingsManager::engine_config() fills
 * this from the user's settings file.
 */
struct EngineConfig {
    // Bytes per read/write; also the in-file cancellation check interval
    size_t copy_buffer_size = 64 * 1024;
    // Minimum spacing of in-file samples (10 per second at most)
    std::chrono::milliseconds sample_interval{100};

    std::chrono::milliseconds rate_window{5000};
    double rate_smoothing = 0.3;
    std::chrono::milliseconds idle_eta_threshold{5000};

    size_t max_visible_notifications = 3;
    size_t max_notification_backlog = 64;
    std::chrono::milliseconds notification_duration{3500};

    bool verify_checksums = false;
    bool preserve_timestamps = true;
    bool follow_symlinks = true;
};

} // namespace ferry
