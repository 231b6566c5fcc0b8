#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "engine_config.hpp"
#include "rate_estimator.hpp"
#include "transfer_job.hpp"

namespace ferry {

/**
 * Single source of truth for one job's progress.
 *
 * Driven by exactly one thread (the job's worker). Every event updates the
 * job and republishes a complete AggregateProgress; readers on any thread
 * pick up the latest snapshot with snapshot(), which never blocks the writer.
 *
 * Guarantees: files_done and bytes_done never decrease, bytes_done equals the
 * sum of the tasks' bytes_copied, and terminal states are final.
 */
class ProgressAggregator {
public:
    // Called on the writer thread after each publication
    using Listener = std::function<void(const std::shared_ptr<const AggregateProgress>&)>;

    ProgressAggregator(TransferJob job, const EngineConfig& config);

    void set_listener(Listener listener) { listener_ = std::move(listener); }

    // Lifecycle transitions; return false when the transition is not allowed
    bool start(TimePoint now);
    bool pause(TimePoint now);
    bool resume(TimePoint now);
    bool complete(TimePoint now);
    bool cancel(TimePoint now);
    bool fail(const std::string& reason, TimePoint now);

    // Enumeration
    void add_task(FileTask task);
    void enumeration_progress(TimePoint now);
    void enumeration_complete(TimePoint now);

    // Per-file progress from the worker
    void file_started(size_t index, TimePoint now);
    void file_progress(size_t index, uint64_t bytes_in_file, TimePoint now);
    void file_finished(size_t index, TimePoint now);
    void file_failed(size_t index, const std::string& reason, TimePoint now);

    std::shared_ptr<const AggregateProgress> snapshot() const;

    // Writer-side view of the job (worker thread only)
    const TransferJob& job() const { return job_; }
    JobStatus status() const { return job_.status; }
    uint64_t files_done() const { return files_done_; }
    uint64_t files_skipped() const { return files_skipped_; }
    uint64_t bytes_done() const { return bytes_done_; }
    uint64_t bytes_total() const { return bytes_total_; }

    // "12 of 15 files copied, 3 skipped"
    std::string summary() const;

private:
    bool transition(JobStatus to, TimePoint now);
    std::string status_text() const;
    int percent() const;
    void publish(TimePoint now);

    TransferJob job_;
    RateEstimator estimator_;

    uint64_t files_done_ = 0;
    uint64_t files_skipped_ = 0;
    uint64_t bytes_done_ = 0;
    uint64_t bytes_total_ = 0;
    bool totals_known_ = false;

    std::optional<size_t> current_index_;
    std::string current_folder_ = "-";
    // Outcome of the last file, shown between files
    std::string last_outcome_;
    std::string failure_reason_;

    std::optional<TimePoint> started_at_;
    std::optional<TimePoint> finished_at_;
    uint64_t version_ = 0;

    std::shared_ptr<const AggregateProgress> published_;
    Listener listener_;
};

} // namespace ferry
