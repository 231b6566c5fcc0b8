#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

#include "transfer_job.hpp"

namespace ferry {

/**
 * Smoothed throughput and ETA from cumulative progress samples.
 *
 * Keeps the samples of the last `window` of monotonic time. Each new sample
 * yields an instantaneous rate over the window, which is folded into an
 * exponential moving average with factor `smoothing`.
 *
 * ETA is unknown until two samples with distinct timestamps exist, while the
 * smoothed rate is zero, and once no sample arrived for `idle_threshold`.
 */
class RateEstimator {
public:
    RateEstimator(std::chrono::milliseconds window = std::chrono::seconds(5),
                  double smoothing = 0.3,
                  std::chrono::milliseconds idle_threshold = std::chrono::seconds(5));

    void add_sample(const ProgressSample& sample);
    void reset();

    // Estimate as seen at `now` for a job of `total_bytes`
    RateEstimate estimate(uint64_t total_bytes, TimePoint now) const;

    double smoothed_rate() const { return smoothed_rate_; }
    size_t sample_count() const { return samples_.size(); }
    std::optional<TimePoint> last_sample_time() const;

private:
    void evict(TimePoint now);

    std::chrono::milliseconds window_;
    double smoothing_;
    std::chrono::milliseconds idle_threshold_;

    std::deque<ProgressSample> samples_;
    double smoothed_rate_ = 0.0;
    bool has_rate_ = false;
};

} // namespace ferry
