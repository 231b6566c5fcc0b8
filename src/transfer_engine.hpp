#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "cancellation.hpp"
#include "engine_config.hpp"
#include "event_channel.hpp"
#include "file_system.hpp"
#include "notification_queue.hpp"
#include "progress_aggregator.hpp"
#include "transfer_job.hpp"

namespace ferry {

/**
 * Runs copy jobs on a dedicated worker thread, one at a time in FIFO order,
 * and exposes their progress to the presentation layer.
 *
 * Control calls (start, pause, resume, cancel, dismiss) and reads
 * (snapshot, visible_notifications) return immediately and never wait for
 * the worker. Progress is also pushed to subscribed EventChannels.
 */
class TransferEngine {
public:
    explicit TransferEngine(const EngineConfig& config = EngineConfig(),
                            std::shared_ptr<FileSystemOps> fs = nullptr);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Queues a job; it stays Pending until the worker picks it up
    JobId start(const JobRequest& request);

    // Each returns false for unknown or finished jobs
    bool pause(JobId id);
    bool resume(JobId id);
    bool cancel(JobId id);

    bool dismiss(NotificationId id);
    std::shared_ptr<const NotificationList> visible_notifications() const;
    size_t expire_notifications();

    // Latest snapshot with elapsed time advanced to now; nullptr for unknown ids
    std::shared_ptr<const AggregateProgress> snapshot(JobId id) const;
    std::vector<JobId> jobs() const;

    // The channel is held weakly; dropping it unsubscribes
    std::shared_ptr<EventChannel> subscribe(size_t capacity = 256);

    // Blocks until the job is terminal or the timeout passes
    bool wait(JobId id, std::chrono::milliseconds timeout);

    // Forgets a terminal job
    bool acknowledge(JobId id);

    // Cancels everything and joins the worker. Idempotent.
    void shutdown();

    const EngineConfig& config() const { return config_; }

private:
    struct JobState {
        std::unique_ptr<ProgressAggregator> aggregator;
        CancellationToken token;
        PauseGate gate;
        bool picked = false;
        JobStatus last_status = JobStatus::Pending;
    };

    void worker_loop();
    void run_job(JobState& state);
    void enumerate(JobState& state);

    void notify(const std::string& message, Severity severity, JobId job_id);
    void broadcast(JobId id, ProgressEventKind kind,
                   const std::shared_ptr<const AggregateProgress>& snapshot);
    void on_publish(JobState& state, const std::shared_ptr<const AggregateProgress>& snapshot);

    std::shared_ptr<JobState> find(JobId id) const;

    EngineConfig config_;
    std::shared_ptr<FileSystemOps> fs_;
    NotificationQueue notifications_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable done_cv_;
    std::map<JobId, std::shared_ptr<JobState>> jobs_;
    std::deque<JobId> queue_;
    JobId next_id_ = 1;
    bool stopping_ = false;

    std::mutex subscribers_mutex_;
    std::vector<std::weak_ptr<EventChannel>> subscribers_;

    std::thread worker_;
};

} // namespace ferry
