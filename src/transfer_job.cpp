#include "transfer_job.hpp"
#include "format.hpp"

namespace ferry {

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Paused:    return "paused";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
    }
    return "unknown";
}

const char* file_status_name(FileStatus status) {
    switch (status) {
        case FileStatus::Pending:    return "pending";
        case FileStatus::InProgress: return "in-progress";
        case FileStatus::Done:       return "done";
        case FileStatus::Skipped:    return "skipped";
        case FileStatus::Errored:    return "errored";
    }
    return "unknown";
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed ||
           status == JobStatus::Cancelled ||
           status == JobStatus::Failed;
}

AggregateProgress AggregateProgress::refreshed(TimePoint now,
                                               std::chrono::milliseconds idle_threshold) const {
    AggregateProgress copy = *this;
    if (is_terminal(status) || !started_at) {
        return copy;
    }

    double elapsed = std::chrono::duration<double>(now - *started_at).count();
    if (elapsed > copy.elapsed_seconds) {
        copy.elapsed_seconds = elapsed;
    }

    // A paused job has no samples by definition; keep its last estimate hidden
    bool idle = !last_sample_at || (now - *last_sample_at) > idle_threshold;
    if (status == JobStatus::Paused || (status == JobStatus::Running && idle && bytes_done < bytes_total)) {
        copy.eta_seconds.reset();
        copy.bytes_per_second = 0.0;
    }
    return copy;
}

std::string AggregateProgress::files_text() const {
    return std::to_string(files_done) + " / " + std::to_string(files_total);
}

std::string AggregateProgress::size_text() const {
    return format_bytes(bytes_done) + " / " + format_bytes(bytes_total);
}

std::string AggregateProgress::eta_text() const {
    if (!eta_seconds) return format_duration(-1.0);
    return format_duration(*eta_seconds);
}

std::string AggregateProgress::elapsed_text() const {
    return format_duration(elapsed_seconds);
}

std::string AggregateProgress::speed_text() const {
    return format_speed(bytes_per_second);
}

} // namespace ferry
