#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "transfer_job.hpp"

namespace ferry {

enum class ProgressEventKind {
    Progress,
    StateChanged,
    FileError,
    Finished
};

struct ProgressEvent {
    JobId job_id = 0;
    ProgressEventKind kind = ProgressEventKind::Progress;
    std::shared_ptr<const AggregateProgress> snapshot;
};

/**
 * Bounded queue of progress events from the engine to one consumer.
 *
 * The producer never blocks: when the consumer falls behind, the oldest
 * Progress event is dropped first (a newer snapshot supersedes it), then
 * the oldest event of any kind.
 */
class EventChannel {
public:
    explicit EventChannel(size_t capacity = 256)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(ProgressEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            if (events_.size() >= capacity_) {
                drop_one();
            }
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    std::optional<ProgressEvent> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take();
    }

    // Waits up to timeout for an event; nullopt on timeout or once closed and drained
    std::optional<ProgressEvent> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
        return take();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    uint64_t dropped_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    std::optional<ProgressEvent> take() {
        if (events_.empty()) return std::nullopt;
        ProgressEvent event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    void drop_one() {
        for (auto it = events_.begin(); it != events_.end(); ++it) {
            if (it->kind == ProgressEventKind::Progress) {
                events_.erase(it);
                dropped_++;
                return;
            }
        }
        events_.pop_front();
        dropped_++;
    }

    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
};

} // namespace ferry
