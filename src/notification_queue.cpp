#include "notification_queue.hpp"
#include "logger.hpp"

#include <algorithm>
#include <atomic>

namespace ferry {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Success: return "success";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "info";
}

NotificationQueue::NotificationQueue(size_t max_visible, size_t max_backlog,
                                     std::chrono::milliseconds default_duration)
    : max_visible_(std::max<size_t>(1, max_visible))
    , max_backlog_(max_backlog)
    , default_duration_(default_duration)
    , published_(std::make_shared<const NotificationList>()) {
}

NotificationId NotificationQueue::push(const std::string& message, Severity severity, TimePoint now,
                                       JobId job_id,
                                       std::optional<std::chrono::milliseconds> duration) {
    std::lock_guard<std::mutex> lock(mutex_);

    Notification n;
    n.id = next_id_++;
    n.job_id = job_id;
    n.message = message;
    n.severity = severity;
    n.created_at = now;
    n.duration = duration.value_or(default_duration_);
    NotificationId id = n.id;

    if (visible_.size() < max_visible_ && backlog_.empty()) {
        n.shown_at = now;
        visible_.push_back(std::move(n));
    } else {
        if (max_backlog_ == 0) {
            dropped_++;
            Logger::debug("[Notifications] Dropped (no backlog): " + message);
            return id;
        }
        if (backlog_.size() >= max_backlog_) {
            Logger::debug("[Notifications] Backlog full, dropping: " + backlog_.front().message);
            backlog_.pop_front();
            dropped_++;
        }
        backlog_.push_back(std::move(n));
    }

    publish();
    return id;
}

bool NotificationQueue::dismiss(NotificationId id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(visible_.begin(), visible_.end(),
                           [id](const Notification& n) { return n.id == id; });
    if (it != visible_.end()) {
        visible_.erase(it);
        promote(now);
        publish();
        return true;
    }

    auto bit = std::find_if(backlog_.begin(), backlog_.end(),
                            [id](const Notification& n) { return n.id == id; });
    if (bit != backlog_.end()) {
        backlog_.erase(bit);
        return true;
    }
    return false;
}

size_t NotificationQueue::expire(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t before = visible_.size();
    visible_.erase(std::remove_if(visible_.begin(), visible_.end(),
                                  [now](const Notification& n) { return n.expired(now); }),
                   visible_.end());
    size_t removed = before - visible_.size();

    if (removed > 0) {
        promote(now);
        publish();
    }
    return removed;
}

void NotificationQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    visible_.clear();
    backlog_.clear();
    publish();
}

void NotificationQueue::promote(TimePoint now) {
    while (visible_.size() < max_visible_ && !backlog_.empty()) {
        Notification n = std::move(backlog_.front());
        backlog_.pop_front();
        n.shown_at = now;
        visible_.push_back(std::move(n));
    }
}

void NotificationQueue::publish() {
    std::atomic_store(&published_, std::shared_ptr<const NotificationList>(
                          std::make_shared<NotificationList>(visible_)));
}

std::shared_ptr<const NotificationList> NotificationQueue::visible() const {
    return std::atomic_load(&published_);
}

size_t NotificationQueue::backlog_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backlog_.size();
}

uint64_t NotificationQueue::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace ferry
