#include "rate_estimator.hpp"

#include <algorithm>

namespace ferry {

RateEstimator::RateEstimator(std::chrono::milliseconds window, double smoothing,
                             std::chrono::milliseconds idle_threshold)
    : window_(window)
    , smoothing_(std::clamp(smoothing, 0.01, 1.0))
    , idle_threshold_(idle_threshold) {
}

void RateEstimator::reset() {
    samples_.clear();
    smoothed_rate_ = 0.0;
    has_rate_ = false;
}

std::optional<TimePoint> RateEstimator::last_sample_time() const {
    if (samples_.empty()) return std::nullopt;
    return samples_.back().timestamp;
}

// Drop samples that left the window, keeping the newest one at or before the
// window start as the baseline
void RateEstimator::evict(TimePoint now) {
    TimePoint cutoff = now - window_;
    while (samples_.size() >= 2 && samples_[1].timestamp <= cutoff) {
        samples_.pop_front();
    }
}

void RateEstimator::add_sample(const ProgressSample& sample) {
    ProgressSample s = sample;

    if (!samples_.empty()) {
        const ProgressSample& last = samples_.back();
        // Out-of-order input is pinned to the newest state
        if (s.timestamp < last.timestamp) s.timestamp = last.timestamp;
        if (s.bytes < last.bytes) s.bytes = last.bytes;

        if (s.timestamp == last.timestamp) {
            samples_.back().bytes = s.bytes;
            return;
        }
    }

    samples_.push_back(s);
    evict(s.timestamp);

    if (samples_.size() < 2) return;

    const ProgressSample& first = samples_.front();
    double dt = std::chrono::duration<double>(s.timestamp - first.timestamp).count();
    if (dt <= 0.0) return;

    double instant = static_cast<double>(s.bytes - first.bytes) / dt;
    if (has_rate_) {
        smoothed_rate_ = smoothing_ * instant + (1.0 - smoothing_) * smoothed_rate_;
    } else {
        smoothed_rate_ = instant;
        has_rate_ = true;
    }
    if (smoothed_rate_ < 0.0) smoothed_rate_ = 0.0;
}

RateEstimate RateEstimator::estimate(uint64_t total_bytes, TimePoint now) const {
    RateEstimate result;
    if (samples_.empty()) return result;

    const ProgressSample& last = samples_.back();
    uint64_t remaining = total_bytes > last.bytes ? total_bytes - last.bytes : 0;

    if (remaining == 0 && has_rate_) {
        result.bytes_per_second = smoothed_rate_;
        result.eta_seconds = 0.0;
        return result;
    }

    if (!has_rate_) return result;

    if (now - last.timestamp > idle_threshold_) {
        return result;
    }

    result.bytes_per_second = smoothed_rate_;
    if (smoothed_rate_ > 0.0) {
        result.eta_seconds = static_cast<double>(remaining) / smoothed_rate_;
    }
    return result;
}

} // namespace ferry
