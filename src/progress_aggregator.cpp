#include "progress_aggregator.hpp"
#include "format.hpp"
#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <limits>

namespace fs = std::filesystem;

namespace ferry {

ProgressAggregator::ProgressAggregator(TransferJob job, const EngineConfig& config)
    : job_(std::move(job))
    , estimator_(config.rate_window, config.rate_smoothing, config.idle_eta_threshold) {
    for (const auto& task : job_.tasks) {
        bytes_total_ += task.size;
    }
    publish(Clock::now());
}

bool ProgressAggregator::transition(JobStatus to, TimePoint now) {
    JobStatus from = job_.status;
    bool allowed = false;
    switch (to) {
        case JobStatus::Running:
            allowed = (from == JobStatus::Pending || from == JobStatus::Paused);
            break;
        case JobStatus::Paused:
            allowed = (from == JobStatus::Running);
            break;
        case JobStatus::Completed:
            allowed = (from == JobStatus::Running || from == JobStatus::Paused);
            break;
        case JobStatus::Cancelled:
        case JobStatus::Failed:
            allowed = !is_terminal(from);
            break;
        case JobStatus::Pending:
            allowed = false;
            break;
    }

    if (!allowed) {
        Logger::debug("[Aggregator] Job " + std::to_string(job_.id) + ": ignoring " +
                      job_status_name(from) + " -> " + job_status_name(to));
        return false;
    }

    job_.status = to;
    if (is_terminal(to)) {
        finished_at_ = now;
        if (to != JobStatus::Completed) {
            // Tasks the job will never reach.
            for (FileTask& task : job_.tasks) {
                if (task.status == FileStatus::Pending || task.status == FileStatus::InProgress) {
                    task.status = FileStatus::Skipped;
                }
            }
        }
        current_index_.reset();
        current_folder_ = "-";
    }
    publish(now);
    return true;
}

bool ProgressAggregator::start(TimePoint now) {
    if (job_.status != JobStatus::Pending) return false;
    started_at_ = now;
    return transition(JobStatus::Running, now);
}

bool ProgressAggregator::pause(TimePoint now) {
    return transition(JobStatus::Paused, now);
}

bool ProgressAggregator::resume(TimePoint now) {
    if (job_.status != JobStatus::Paused) return false;
    return transition(JobStatus::Running, now);
}

bool ProgressAggregator::complete(TimePoint now) {
    return transition(JobStatus::Completed, now);
}

bool ProgressAggregator::cancel(TimePoint now) {
    return transition(JobStatus::Cancelled, now);
}

bool ProgressAggregator::fail(const std::string& reason, TimePoint now) {
    failure_reason_ = reason;
    return transition(JobStatus::Failed, now);
}

void ProgressAggregator::add_task(FileTask task) {
    if (totals_known_) {
        Logger::warn("[Aggregator] Task added after enumeration finished: " + task.relative_path);
    }
    bytes_total_ += task.size;
    job_.tasks.push_back(std::move(task));
}

void ProgressAggregator::enumeration_progress(TimePoint now) {
    publish(now);
}

void ProgressAggregator::enumeration_complete(TimePoint now) {
    totals_known_ = true;
    publish(now);
}

void ProgressAggregator::file_started(size_t index, TimePoint now) {
    if (index >= job_.tasks.size()) return;
    FileTask& task = job_.tasks[index];
    task.status = FileStatus::InProgress;
    current_index_ = index;

    std::string parent = fs::path(task.relative_path).parent_path().string();
    if (parent.empty()) {
        parent = fs::path(job_.source_root).filename().string();
        if (parent.empty()) parent = job_.source_root;
    }
    current_folder_ = parent;

    // A file boundary is always a sample, even without new bytes
    estimator_.add_sample({now, bytes_done_});
    publish(now);
}

void ProgressAggregator::file_progress(size_t index, uint64_t bytes_in_file, TimePoint now) {
    if (index >= job_.tasks.size()) return;
    FileTask& task = job_.tasks[index];

    uint64_t clamped = std::min(bytes_in_file, task.size);
    if (clamped > task.bytes_copied) {
        bytes_done_ += clamped - task.bytes_copied;
        task.bytes_copied = clamped;
    }

    estimator_.add_sample({now, bytes_done_});
    publish(now);
}

void ProgressAggregator::file_finished(size_t index, TimePoint now) {
    if (index >= job_.tasks.size()) return;
    FileTask& task = job_.tasks[index];

    if (task.bytes_copied < task.size) {
        bytes_done_ += task.size - task.bytes_copied;
        task.bytes_copied = task.size;
    }
    task.status = FileStatus::Done;
    files_done_++;
    current_index_.reset();
    last_outcome_ = "Copied " + fs::path(task.relative_path).filename().string();

    estimator_.add_sample({now, bytes_done_});
    publish(now);
}

void ProgressAggregator::file_failed(size_t index, const std::string& reason, TimePoint now) {
    if (index >= job_.tasks.size()) return;
    FileTask& task = job_.tasks[index];
    task.status = FileStatus::Errored;
    task.error_reason = reason;
    files_skipped_++;
    current_index_.reset();
    last_outcome_ = "Skipped " + fs::path(task.relative_path).filename().string();
    publish(now);
}

std::string ProgressAggregator::summary() const {
    return std::to_string(files_done_) + " of " + std::to_string(job_.tasks.size()) +
           " files copied, " + std::to_string(files_skipped_) + " skipped";
}

std::string ProgressAggregator::status_text() const {
    switch (job_.status) {
        case JobStatus::Pending:
            return "Waiting to start";
        case JobStatus::Paused:
            return "Paused";
        case JobStatus::Cancelled:
            return "Cancelled by user";
        case JobStatus::Failed:
            return "Failed: " + failure_reason_;
        case JobStatus::Completed:
            if (job_.tasks.empty()) return "No files found to copy";
            if (files_skipped_ == 0) return "Completed";
            return summary();
        case JobStatus::Running:
            break;
    }

    if (!totals_known_) {
        return "Scanning source folder...";
    }

    std::string text;
    if (current_index_) {
        const FileTask& task = job_.tasks[*current_index_];
        std::string name = fs::path(task.relative_path).filename().string();
        text = "Copying " + name + " (" + format_bytes(task.size) + ")";
    } else if (!last_outcome_.empty()) {
        text = last_outcome_;
    } else {
        text = "Preparing...";
    }
    if (files_skipped_ > 0) {
        text += ", " + std::to_string(files_skipped_) +
                (files_skipped_ == 1 ? " file skipped" : " files skipped");
    }
    return text;
}

int ProgressAggregator::percent() const {
    if (!totals_known_) return 0;

    if (bytes_total_ > 0) {
        uint64_t pct;
        if (bytes_done_ <= std::numeric_limits<uint64_t>::max() / 100) {
            pct = (bytes_done_ * 100) / bytes_total_;
        } else {
            pct = bytes_done_ / (bytes_total_ / 100);
        }
        return static_cast<int>(std::min<uint64_t>(pct, 100));
    }

    uint64_t files_total = job_.tasks.size();
    if (files_total > 0) {
        return static_cast<int>(((files_done_ + files_skipped_) * 100) / files_total);
    }
    return job_.status == JobStatus::Completed ? 100 : 0;
}

void ProgressAggregator::publish(TimePoint now) {
    auto snap = std::make_shared<AggregateProgress>();
    snap->job_id = job_.id;
    snap->version = ++version_;
    snap->status = job_.status;
    snap->status_text = status_text();
    snap->source_root = job_.source_root;
    snap->current_folder = current_folder_;

    snap->files_done = files_done_;
    snap->files_skipped = files_skipped_;
    snap->files_total = job_.tasks.size();
    snap->bytes_done = bytes_done_;
    snap->bytes_total = bytes_total_;
    snap->totals_known = totals_known_;
    snap->percent = percent();

    if (job_.status == JobStatus::Completed) {
        snap->eta_seconds = 0.0;
    } else if (job_.status == JobStatus::Running && totals_known_) {
        RateEstimate rate = estimator_.estimate(bytes_total_, now);
        snap->bytes_per_second = rate.bytes_per_second;
        snap->eta_seconds = rate.eta_seconds;
    }

    snap->started_at = started_at_;
    snap->finished_at = finished_at_;
    snap->last_sample_at = estimator_.last_sample_time();
    if (started_at_) {
        TimePoint end = finished_at_ ? *finished_at_ : now;
        snap->elapsed_seconds = std::max(0.0, std::chrono::duration<double>(end - *started_at_).count());
    }

    std::shared_ptr<const AggregateProgress> published(std::move(snap));
    std::atomic_store(&published_, published);
    if (listener_) {
        listener_(published);
    }
}

std::shared_ptr<const AggregateProgress> ProgressAggregator::snapshot() const {
    return std::atomic_load(&published_);
}

} // namespace ferry
