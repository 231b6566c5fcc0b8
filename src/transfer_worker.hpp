#pragma once

#include <functional>
#include <string>

#include "cancellation.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "file_system.hpp"
#include "progress_aggregator.hpp"

namespace ferry {

/**
 * Copies a job's files to the destination, one task at a time.
 *
 * Runs on the engine's worker thread and reports every byte through the
 * job's ProgressAggregator. Destination files are written to
 * "<name>.ferrypart" and renamed into place once complete, so cancellation
 * or a failed copy never leaves a partial file behind.
 *
 * The cancellation token is checked between files and after every buffer
 * within a file; the pause gate is honoured at the same checkpoints.
 */
class TransferWorker {
public:
    using FileErrorCallback = std::function<void(const FileTask& task, const PerFileError& error)>;

    static constexpr const char* PARTIAL_SUFFIX = ".ferrypart";

    TransferWorker(FileSystemOps& fs, const EngineConfig& config);

    /**
     * Copies every Pending task of the aggregator's job.
     *
     * Per-file errors are recorded on the task and reported through
     * on_file_error; the loop continues with the next task.
     *
     * @throws JobFatalError when the destination is gone or full. The task
     *         in flight is marked Errored, later tasks stay Pending.
     * @throws CancelledError when the token is set
     */
    void run(ProgressAggregator& aggregator, const CancellationToken& token, PauseGate& gate,
             const FileErrorCallback& on_file_error = nullptr);

    /**
     * Copies one task. Throws PerFileError, JobFatalError or CancelledError;
     * the caller records the outcome on the aggregator.
     */
    void copy_file(ProgressAggregator& aggregator, size_t index,
                   const CancellationToken& token, PauseGate& gate);

    // Destination path of a task (without the partial suffix)
    std::string destination_path(const TransferJob& job, const FileTask& task) const;

    // Throws CancelledError when cancelled; parks the caller while paused
    void checkpoint(ProgressAggregator& aggregator, const CancellationToken& token, PauseGate& gate);

private:
    void ensure_space(const std::string& directory, const FileTask& task);
    [[noreturn]] void raise_write_error(const std::string& what, const std::string& path,
                                        const std::error_code& ec);
    void discard_partial(const std::string& path);

    FileSystemOps& fs_;
    EngineConfig config_;
};

} // namespace ferry
