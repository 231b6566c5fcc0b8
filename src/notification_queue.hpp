#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transfer_job.hpp"

namespace ferry {

enum class Severity {
    Info,
    Success,
    Warning,
    Error
};

const char* severity_name(Severity severity);

/**
 * Transient message shown over the progress view.
 * The expiry timer starts when the notification becomes visible.
 */
struct Notification {
    NotificationId id = 0;
    JobId job_id = 0;
    std::string message;
    Severity severity = Severity::Info;
    TimePoint created_at;
    std::chrono::milliseconds duration{0};
    std::optional<TimePoint> shown_at;

    bool expired(TimePoint now) const {
        return shown_at && (now - *shown_at) >= duration;
    }
};

using NotificationList = std::vector<Notification>;

/**
 * Bounded set of visible notifications with a FIFO backlog.
 *
 * At most max_visible entries are visible. Further entries wait and are
 * promoted in arrival order as slots free up. When the backlog is full the
 * oldest waiting entry is dropped. Writers hold the internal lock only for
 * in-memory bookkeeping; readers take the published list without locking.
 */
class NotificationQueue {
public:
    NotificationQueue(size_t max_visible = 3,
                      size_t max_backlog = 64,
                      std::chrono::milliseconds default_duration = std::chrono::milliseconds(3500));

    NotificationId push(const std::string& message, Severity severity, TimePoint now,
                        JobId job_id = 0,
                        std::optional<std::chrono::milliseconds> duration = std::nullopt);

    // Removes a visible or waiting notification. False if the id is unknown.
    bool dismiss(NotificationId id, TimePoint now);

    // Removes expired visible entries and promotes waiting ones; returns count removed
    size_t expire(TimePoint now);

    void clear();

    std::shared_ptr<const NotificationList> visible() const;
    size_t backlog_size() const;
    uint64_t dropped_count() const;
    size_t max_visible() const { return max_visible_; }

private:
    void promote(TimePoint now);
    void publish();

    size_t max_visible_;
    size_t max_backlog_;
    std::chrono::milliseconds default_duration_;

    mutable std::mutex mutex_;
    NotificationList visible_;
    std::deque<Notification> backlog_;
    NotificationId next_id_ = 1;
    uint64_t dropped_ = 0;

    std::shared_ptr<const NotificationList> published_;
};

} // namespace ferry
