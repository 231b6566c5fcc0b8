#include "transfer_worker.hpp"
#include "checksum.hpp"
#include "format.hpp"
#include "logger.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace ferry {

TransferWorker::TransferWorker(FileSystemOps& fs, const EngineConfig& config)
    : fs_(fs)
    , config_(config) {
    if (config_.copy_buffer_size == 0) {
        config_.copy_buffer_size = 64 * 1024;
    }
}

std::string TransferWorker::destination_path(const TransferJob& job, const FileTask& task) const {
    return (fs::path(job.destination_root) / task.relative_path).string();
}

void TransferWorker::run(ProgressAggregator& aggregator, const CancellationToken& token,
                         PauseGate& gate, const FileErrorCallback& on_file_error) {
    const TransferJob& job = aggregator.job();
    Logger::info("[Worker] Job " + std::to_string(job.id) + ": copying " +
                 std::to_string(job.tasks.size()) + " files (" +
                 format_bytes(aggregator.bytes_total()) + ") to " + job.destination_root);

    for (size_t i = 0; i < job.tasks.size(); ++i) {
        if (job.tasks[i].status != FileStatus::Pending) continue;

        checkpoint(aggregator, token, gate);

        try {
            copy_file(aggregator, i, token, gate);
        } catch (const PerFileError& e) {
            Logger::warn("[Worker] Skipping " + job.tasks[i].relative_path + ": " + e.what());
            aggregator.file_failed(i, e.what(), Clock::now());
            if (on_file_error) {
                on_file_error(job.tasks[i], e);
            }
        } catch (const JobFatalError& e) {
            if (job.tasks[i].status == FileStatus::InProgress) {
                aggregator.file_failed(i, e.what(), Clock::now());
            }
            throw;
        }
    }
}

void TransferWorker::checkpoint(ProgressAggregator& aggregator, const CancellationToken& token,
                                PauseGate& gate) {
    token.throw_if_cancelled();
    if (!gate.is_paused()) return;

    aggregator.pause(Clock::now());
    Logger::info("[Worker] Job " + std::to_string(aggregator.job().id) + " paused");
    gate.wait_while_paused(token);
    token.throw_if_cancelled();
    aggregator.resume(Clock::now());
    Logger::info("[Worker] Job " + std::to_string(aggregator.job().id) + " resumed");
}

void TransferWorker::ensure_space(const std::string& directory, const FileTask& task) {
    uint64_t available = 0;
    std::error_code ec = fs_.free_space(directory, available);
    if (ec) {
        if (is_destination_fatal(ec)) {
            throw JobFatalError("Destination unavailable: " + ec.message(), ec);
        }
        Logger::warn("[Worker] Cannot query free space on " + directory + ": " + ec.message());
        return;
    }

    if (available < task.size) {
        throw JobFatalError("Not enough space on destination for " + task.relative_path + " (" +
                                format_bytes(task.size) + " needed, " +
                                format_bytes(available) + " available)",
                            std::make_error_code(std::errc::no_space_on_device));
    }
}

void TransferWorker::raise_write_error(const std::string& what, const std::string& path,
                                       const std::error_code& ec) {
    if (is_destination_fatal(ec)) {
        Logger::error("[Worker] " + what + " " + path + ": " + ec.message());
        throw JobFatalError("Destination unavailable: " + ec.message(), ec);
    }
    throw PerFileError(classify_file_error(ec, true), what + ": " + ec.message(), ec);
}

void TransferWorker::discard_partial(const std::string& path) {
    std::error_code ec = fs_.remove(path);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        Logger::warn("[Worker] Could not remove partial file " + path + ": " + ec.message());
    }
}

void TransferWorker::copy_file(ProgressAggregator& aggregator, size_t index,
                               const CancellationToken& token, PauseGate& gate) {
    const TransferJob& job = aggregator.job();
    const FileTask& task = job.tasks.at(index);

    const std::string destination = destination_path(job, task);
    const std::string partial = destination + PARTIAL_SUFFIX;
    const std::string directory = fs::path(destination).parent_path().string();

    std::error_code ec = fs_.create_directories(directory);
    if (ec) {
        raise_write_error("Cannot create destination folder", directory, ec);
    }

    // Must happen before the task leaves Pending
    ensure_space(directory, task);

    aggregator.file_started(index, Clock::now());
    Logger::debug("[Worker] Copying " + task.source_path + " -> " + destination);

    auto reader = fs_.open_read(task.source_path, ec);
    if (ec || !reader) {
        throw PerFileError(classify_file_error(ec, false),
                           "Cannot open source file: " + ec.message(), ec);
    }

    auto writer = fs_.open_write(partial, ec);
    if (ec || !writer) {
        raise_write_error("Cannot create destination file", partial, ec);
    }

    std::unique_ptr<Sha256> hasher;
    if (config_.verify_checksums) {
        hasher = std::make_unique<Sha256>();
    }

    std::vector<char> buffer(config_.copy_buffer_size);
    uint64_t copied = 0;
    TimePoint last_sample = Clock::now();

    try {
        for (;;) {
            checkpoint(aggregator, token, gate);

            size_t n = reader->read(buffer.data(), buffer.size(), ec);
            if (ec) {
                throw PerFileError(classify_file_error(ec, false), "Read failed: " + ec.message(), ec);
            }
            if (n == 0) break;

            if (!writer->write(buffer.data(), n, ec)) {
                raise_write_error("Write failed", partial, ec);
            }
            if (hasher) {
                hasher->update(buffer.data(), n);
            }
            copied += n;

            // Coalesce: at most one sample per sample_interval
            TimePoint now = Clock::now();
            if (now - last_sample >= config_.sample_interval) {
                aggregator.file_progress(index, copied, now);
                last_sample = now;
            }
        }
        reader.reset();

        ec = writer->close();
        writer.reset();
        if (ec) {
            raise_write_error("Write failed", partial, ec);
        }

        if (hasher) {
            std::string expected = hasher->finish();
            std::string actual = sha256_file(fs_, partial, ec, config_.copy_buffer_size);
            if (ec) {
                throw PerFileError(FileErrorKind::ReadFailed,
                                   "Cannot re-read copy for verification: " + ec.message(), ec);
            }
            if (actual != expected) {
                Logger::error("[Worker] Checksum mismatch for " + task.relative_path +
                              ": source " + expected + ", copy " + actual);
                throw PerFileError(FileErrorKind::ChecksumMismatch, "Checksum mismatch after copy");
            }
        }

        ec = fs_.rename(partial, destination);
        if (ec) {
            raise_write_error("Cannot move copy into place", destination, ec);
        }
    } catch (...) {
        writer.reset();
        discard_partial(partial);
        throw;
    }

    if (config_.preserve_timestamps && task.mtime_ns != 0) {
        ec = fs_.set_mtime(destination, task.mtime_ns);
        if (ec) {
            Logger::warn("[Worker] Could not preserve modification time of " + destination + ": " +
                         ec.message());
        }
    }

    aggregator.file_finished(index, Clock::now());
}

} // namespace ferry
