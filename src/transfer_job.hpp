#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

// Monotonic clock used for every timestamp in the engine
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using JobId = uint64_t;
using NotificationId = uint64_t;

enum class JobStatus {
    Pending,
    Running,
    Paused,
    Cancelled,
    Completed,
    Failed
};

enum class FileStatus {
    Pending,
    InProgress,
    Done,
    Skipped,
    Errored
};

const char* job_status_name(JobStatus status);
const char* file_status_name(FileStatus status);
bool is_terminal(JobStatus status);

/**
 * One file within a job. bytes_copied never exceeds size and never decreases.
 */
struct FileTask {
    std::string relative_path;
    std::string source_path;
    uint64_t size = 0;
    uint64_t bytes_copied = 0;
    int64_t mtime_ns = 0;
    FileStatus status = FileStatus::Pending;
    std::string error_reason;
};

/**
 * Immutable progress sample: cumulative job bytes at a monotonic instant.
 */
struct ProgressSample {
    TimePoint timestamp;
    uint64_t bytes = 0;
};

/**
 * Smoothed throughput. eta_seconds is empty while the estimate is unknown.
 */
struct RateEstimate {
    double bytes_per_second = 0.0;
    std::optional<double> eta_seconds;
};

/**
 * What the caller asks the engine to copy.
 */
struct JobRequest {
    std::string source_root;
    std::string destination_root;
};

/**
 * One enumerate-then-copy operation. Owned by the engine until acknowledged.
 */
struct TransferJob {
    JobId id = 0;
    std::string source_root;
    std::string destination_root;
    std::vector<FileTask> tasks;
    std::chrono::system_clock::time_point created_at;
    JobStatus status = JobStatus::Pending;
};

/**
 * Externally visible progress of one job. Published whole; never mutated
 * after publication.
 */
struct AggregateProgress {
    JobId job_id = 0;
    uint64_t version = 0;
    JobStatus status = JobStatus::Pending;

    std::string status_text;
    std::string source_root;
    std::string current_folder = "-";

    uint64_t files_done = 0;
    uint64_t files_skipped = 0;
    uint64_t files_total = 0;
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;
    bool totals_known = false;

    int percent = 0;
    double bytes_per_second = 0.0;
    std::optional<double> eta_seconds;
    double elapsed_seconds = 0.0;

    std::optional<TimePoint> started_at;
    std::optional<TimePoint> finished_at;
    std::optional<TimePoint> last_sample_at;

    // Copy with elapsed time advanced to now and the ETA dropped once no
    // sample arrived for idle_threshold. Terminal snapshots are returned as-is.
    AggregateProgress refreshed(TimePoint now, std::chrono::milliseconds idle_threshold) const;

    std::string files_text() const;
    std::string size_text() const;
    std::string eta_text() const;
    std::string elapsed_text() const;
    std::string speed_text() const;
};

} // namespace ferry
