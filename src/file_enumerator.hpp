#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "file_system.hpp"
#include "transfer_job.hpp"

namespace ferry {

/**
 * Lazily walks a source root, yielding one FileTask per regular file.
 *
 * Order is deterministic: within a directory, files sorted by name come
 * first, then each subdirectory (sorted) is walked depth-first. Only the
 * directories on the current path are held in memory.
 *
 * Throws EnumerationError when the root is missing or unreadable, or when a
 * symbolic link leads back into one of its own ancestors. Throws
 * CancelledError once the token is set; it is checked for every directory
 * entered and every step of the walk.
 */
class FileEnumerator {
public:
    FileEnumerator(std::string root, FileSystemOps& fs, bool follow_symlinks = true,
                   CancellationToken token = CancellationToken());

    // Next file, or nullopt once the walk is complete
    std::optional<FileTask> next();

    // Start over from the root (used when a job is retried)
    void restart();

    bool finished() const { return finished_; }
    uint64_t files_seen() const { return files_seen_; }
    uint64_t bytes_seen() const { return bytes_seen_; }

private:
    struct FileEntry {
        std::string name;
        EntryInfo info;
    };

    struct Frame {
        std::string absolute;
        std::string relative;
        uint64_t device = 0;
        uint64_t inode = 0;
        std::vector<FileEntry> files;
        std::vector<std::string> subdirs;
        size_t next_file = 0;
        size_t next_dir = 0;
    };

    void open_root();
    // Returns false when the directory could not be listed
    bool push_directory(const std::string& absolute, const std::string& relative,
                        const EntryInfo& info, bool is_root);
    FileTask make_task(const Frame& frame, const FileEntry& entry) const;

    std::string root_;
    FileSystemOps& fs_;
    bool follow_symlinks_;
    CancellationToken token_;

    std::vector<Frame> stack_;
    std::optional<FileTask> single_file_;
    bool opened_ = false;
    bool finished_ = false;
    uint64_t files_seen_ = 0;
    uint64_t bytes_seen_ = 0;
};

} // namespace ferry
