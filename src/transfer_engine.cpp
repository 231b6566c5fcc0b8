#include "transfer_engine.hpp"
#include "errors.hpp"
#include "file_enumerator.hpp"
#include "format.hpp"
#include "logger.hpp"
#include "transfer_worker.hpp"

#include <algorithm>

namespace ferry {

TransferEngine::TransferEngine(const EngineConfig& config, std::shared_ptr<FileSystemOps> fs)
    : config_(config)
    , fs_(fs ? std::move(fs) : std::make_shared<PosixFileSystem>())
    , notifications_(config.max_visible_notifications,
                     config.max_notification_backlog,
                     config.notification_duration) {
    worker_ = std::thread(&TransferEngine::worker_loop, this);
    Logger::debug("[Engine] Worker thread started");
}

TransferEngine::~TransferEngine() {
    shutdown();
}

void TransferEngine::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) return;
        stopping_ = true;
        for (auto& entry : jobs_) {
            JobState& state = *entry.second;
            state.token.cancel();
            state.gate.resume();
            if (!state.picked && !is_terminal(state.aggregator->status())) {
                state.aggregator->cancel(Clock::now());
            }
        }
        queue_.clear();
    }
    queue_cv_.notify_all();
    done_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
        Logger::debug("[Engine] Worker thread stopped");
    }

    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    for (auto& weak : subscribers_) {
        if (auto channel = weak.lock()) {
            channel->close();
        }
    }
    subscribers_.clear();
}

JobId TransferEngine::start(const JobRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        throw TransferError("Transfer engine is shut down");
    }

    TransferJob job;
    job.id = next_id_++;
    job.source_root = request.source_root;
    job.destination_root = request.destination_root;
    job.created_at = std::chrono::system_clock::now();

    auto state = std::make_shared<JobState>();
    state->aggregator = std::make_unique<ProgressAggregator>(std::move(job), config_);

    JobState* raw = state.get();
    state->aggregator->set_listener(
        [this, raw](const std::shared_ptr<const AggregateProgress>& snap) { on_publish(*raw, snap); });

    JobId id = state->aggregator->job().id;
    jobs_[id] = state;
    queue_.push_back(id);

    Logger::info("[Engine] Queued job " + std::to_string(id) + ": " + request.source_root +
                 " -> " + request.destination_root);
    queue_cv_.notify_one();
    return id;
}

std::shared_ptr<TransferEngine::JobState> TransferEngine::find(JobId id) const {
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

bool TransferEngine::pause(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = find(id);
    if (!state) return false;

    JobStatus status = state->aggregator->snapshot()->status;
    if (is_terminal(status) || state->gate.is_paused()) return false;

    state->gate.pause();
    Logger::info("[Engine] Pause requested for job " + std::to_string(id));
    return true;
}

bool TransferEngine::resume(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = find(id);
    if (!state) return false;

    JobStatus status = state->aggregator->snapshot()->status;
    if (is_terminal(status) || !state->gate.is_paused()) return false;

    state->gate.resume();
    Logger::info("[Engine] Resume requested for job " + std::to_string(id));
    return true;
}

bool TransferEngine::cancel(JobId id) {
    bool cancelled_pending = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto state = find(id);
        if (!state) return false;

        JobStatus status = state->aggregator->snapshot()->status;
        if (is_terminal(status)) return false;

        state->token.cancel();
        Logger::info("[Engine] Cancel requested for job " + std::to_string(id));

        // Not yet picked up: the worker will never touch it, so finish it here
        if (!state->picked) {
            notify("Copy cancelled", Severity::Info, id);
            state->aggregator->cancel(Clock::now());
            queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
            cancelled_pending = true;
        }
    }

    if (cancelled_pending) {
        done_cv_.notify_all();
    }
    return true;
}

bool TransferEngine::dismiss(NotificationId id) {
    return notifications_.dismiss(id, Clock::now());
}

std::shared_ptr<const NotificationList> TransferEngine::visible_notifications() const {
    return notifications_.visible();
}

size_t TransferEngine::expire_notifications() {
    return notifications_.expire(Clock::now());
}

std::shared_ptr<const AggregateProgress> TransferEngine::snapshot(JobId id) const {
    std::shared_ptr<JobState> state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state = find(id);
    }
    if (!state) return nullptr;

    auto snap = state->aggregator->snapshot();
    return std::make_shared<const AggregateProgress>(
        snap->refreshed(Clock::now(), config_.idle_eta_threshold));
}

std::vector<JobId> TransferEngine::jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobId> ids;
    ids.reserve(jobs_.size());
    for (const auto& entry : jobs_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::shared_ptr<EventChannel> TransferEngine::subscribe(size_t capacity) {
    auto channel = std::make_shared<EventChannel>(capacity);
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.push_back(channel);
    return channel;
}

bool TransferEngine::wait(JobId id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto state = find(id);
    if (!state) return false;

    return done_cv_.wait_for(lock, timeout, [&state] {
        return is_terminal(state->aggregator->snapshot()->status);
    });
}

bool TransferEngine::acknowledge(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return false;
    if (!is_terminal(it->second->aggregator->snapshot()->status)) return false;

    jobs_.erase(it);
    Logger::debug("[Engine] Job " + std::to_string(id) + " acknowledged");
    return true;
}

void TransferEngine::notify(const std::string& message, Severity severity, JobId job_id) {
    notifications_.push(message, severity, Clock::now(), job_id);
}

void TransferEngine::broadcast(JobId id, ProgressEventKind kind,
                               const std::shared_ptr<const AggregateProgress>& snapshot) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    if (subscribers_.empty()) return;

    auto it = subscribers_.begin();
    while (it != subscribers_.end()) {
        if (auto channel = it->lock()) {
            channel->push(ProgressEvent{id, kind, snapshot});
            ++it;
        } else {
            it = subscribers_.erase(it);
        }
    }
}

void TransferEngine::on_publish(JobState& state, const std::shared_ptr<const AggregateProgress>& snapshot) {
    ProgressEventKind kind = ProgressEventKind::Progress;
    if (is_terminal(snapshot->status)) {
        kind = ProgressEventKind::Finished;
    } else if (snapshot->status != state.last_status) {
        kind = ProgressEventKind::StateChanged;
    }
    state.last_status = snapshot->status;
    broadcast(snapshot->job_id, kind, snapshot);
}

void TransferEngine::worker_loop() {
    for (;;) {
        std::shared_ptr<JobState> state;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) return;

            JobId id = queue_.front();
            queue_.pop_front();
            state = find(id);
            if (!state || is_terminal(state->aggregator->status())) continue;

            // Start under the lock so cancel() sees either Pending-and-unpicked or Running
            state->picked = true;
            state->aggregator->start(Clock::now());
        }

        run_job(*state);

        {
            // Pairs with the predicate check in wait()
            std::lock_guard<std::mutex> lock(mutex_);
        }
        done_cv_.notify_all();
    }
}

void TransferEngine::enumerate(JobState& state) {
    ProgressAggregator& aggregator = *state.aggregator;
    TransferWorker worker(*fs_, config_);
    const TransferJob& job = aggregator.job();

    Logger::info("[Enumerator] Scanning " + job.source_root);
    FileEnumerator enumerator(job.source_root, *fs_, config_.follow_symlinks, state.token);

    TimePoint last_publish = Clock::now();
    while (auto task = enumerator.next()) {
        worker.checkpoint(aggregator, state.token, state.gate);
        aggregator.add_task(std::move(*task));

        TimePoint now = Clock::now();
        if (now - last_publish >= config_.sample_interval) {
            aggregator.enumeration_progress(now);
            last_publish = now;
        }
    }
    aggregator.enumeration_complete(Clock::now());

    Logger::info("[Enumerator] Found " + std::to_string(enumerator.files_seen()) + " files (" +
                 format_bytes(enumerator.bytes_seen()) + ")");
}

void TransferEngine::run_job(JobState& state) {
    ProgressAggregator& aggregator = *state.aggregator;
    const JobId id = aggregator.job().id;

    // Terminal notifications are queued before the terminal transition so a
    // caller returning from wait() already sees them
    try {
        enumerate(state);

        if (aggregator.job().tasks.empty()) {
            Logger::info("[Engine] Job " + std::to_string(id) + ": no files found to copy");
            notify("No files found to copy", Severity::Info, id);
            aggregator.complete(Clock::now());
            return;
        }

        std::error_code ec = fs_->create_directories(aggregator.job().destination_root);
        if (ec) {
            throw JobFatalError("Cannot create destination folder: " + ec.message(), ec);
        }

        notify("Copying " + std::to_string(aggregator.job().tasks.size()) + " files (" +
                   format_bytes(aggregator.bytes_total()) + ")",
               Severity::Info, id);

        TransferWorker worker(*fs_, config_);
        worker.run(aggregator, state.token, state.gate,
                   [this, &aggregator, id](const FileTask& task, const PerFileError& error) {
                       notify("Skipped " + task.relative_path + ": " + error.what(),
                              Severity::Warning, id);
                       broadcast(id, ProgressEventKind::FileError, aggregator.snapshot());
                   });

        if (aggregator.files_skipped() == 0) {
            Logger::info("[Engine] Job " + std::to_string(id) + " completed");
            notify("Copy completed successfully", Severity::Success, id);
        } else {
            Logger::warn("[Engine] Job " + std::to_string(id) + " completed: " + aggregator.summary());
            notify("Copy finished with errors: " + aggregator.summary(), Severity::Warning, id);
        }
        aggregator.complete(Clock::now());
    } catch (const CancelledError&) {
        Logger::info("[Engine] Job " + std::to_string(id) + " cancelled");
        notify("Copy cancelled", Severity::Info, id);
        aggregator.cancel(Clock::now());
    } catch (const TransferError& e) {
        Logger::error("[Engine] Job " + std::to_string(id) + " failed: " + e.what());
        notify(std::string("Copy failed: ") + e.what(), Severity::Error, id);
        aggregator.fail(e.what(), Clock::now());
    } catch (const std::exception& e) {
        Logger::error("[Engine] Job " + std::to_string(id) + " aborted by unexpected error: " + e.what());
        notify(std::string("Copy failed: ") + e.what(), Severity::Error, id);
        aggregator.fail(e.what(), Clock::now());
    }
}

} // namespace ferry
