#include "file_enumerator.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>

namespace fs = std::filesystem;

namespace ferry {

FileEnumerator::FileEnumerator(std::string root, FileSystemOps& fs, bool follow_symlinks,
                               CancellationToken token)
    : root_(std::move(root))
    , fs_(fs)
    , follow_symlinks_(follow_symlinks)
    , token_(std::move(token)) {
}

void FileEnumerator::restart() {
    stack_.clear();
    single_file_.reset();
    opened_ = false;
    finished_ = false;
    files_seen_ = 0;
    bytes_seen_ = 0;
}

void FileEnumerator::open_root() {
    opened_ = true;

    EntryInfo info;
    std::error_code ec = fs_.stat(root_, info);
    if (ec) {
        if (ec.value() == ENOENT || ec.value() == ENOTDIR) {
            throw EnumerationError("Source folder does not exist: " + root_);
        }
        throw EnumerationError("Source folder is not readable: " + root_ + " (" + ec.message() + ")");
    }

    if (info.type == EntryType::Regular) {
        FileTask task;
        task.relative_path = fs::path(root_).filename().string();
        task.source_path = root_;
        task.size = info.size;
        task.mtime_ns = info.mtime_ns;
        single_file_ = task;
        return;
    }

    if (info.type != EntryType::Directory) {
        throw EnumerationError("Source is neither a folder nor a regular file: " + root_);
    }

    if (!push_directory(root_, "", info, true)) {
        throw EnumerationError("Source folder is not readable: " + root_);
    }
    Logger::debug("[Enumerator] Walking " + root_);
}

bool FileEnumerator::push_directory(const std::string& absolute, const std::string& relative,
                                    const EntryInfo& info, bool is_root) {
    token_.throw_if_cancelled();

    for (const auto& ancestor : stack_) {
        if (ancestor.device == info.device && ancestor.inode == info.inode) {
            throw EnumerationError("Symbolic link cycle detected at " + absolute +
                                   " (points back to " + ancestor.absolute + ")");
        }
    }

    std::vector<std::string> names;
    std::error_code ec = fs_.list_directory(absolute, names);
    if (ec) {
        if (!is_root) {
            Logger::warn("[Enumerator] Skipping unreadable folder " + absolute + ": " + ec.message());
        }
        return false;
    }
    std::sort(names.begin(), names.end());

    Frame frame;
    frame.absolute = absolute;
    frame.relative = relative;
    frame.device = info.device;
    frame.inode = info.inode;

    for (const auto& name : names) {
        std::string child = (fs::path(absolute) / name).string();

        EntryInfo child_info;
        ec = fs_.lstat(child, child_info);
        if (ec) {
            Logger::warn("[Enumerator] Cannot stat " + child + ": " + ec.message());
            continue;
        }

        if (child_info.type == EntryType::Symlink) {
            if (!follow_symlinks_) {
                Logger::debug("[Enumerator] Not following symbolic link " + child);
                continue;
            }
            ec = fs_.stat(child, child_info);
            if (ec) {
                Logger::warn("[Enumerator] Skipping broken symbolic link " + child);
                continue;
            }
        }

        if (child_info.type == EntryType::Regular) {
            frame.files.push_back({name, child_info});
        } else if (child_info.type == EntryType::Directory) {
            frame.subdirs.push_back(name);
        } else {
            Logger::warn("[Enumerator] Skipping special file " + child);
        }
    }

    stack_.push_back(std::move(frame));
    return true;
}

FileTask FileEnumerator::make_task(const Frame& frame, const FileEntry& entry) const {
    FileTask task;
    task.relative_path = frame.relative.empty()
        ? entry.name
        : (fs::path(frame.relative) / entry.name).string();
    task.source_path = (fs::path(frame.absolute) / entry.name).string();
    task.size = entry.info.size;
    task.mtime_ns = entry.info.mtime_ns;
    return task;
}

std::optional<FileTask> FileEnumerator::next() {
    if (finished_) return std::nullopt;
    if (!opened_) open_root();

    if (single_file_) {
        FileTask task = *single_file_;
        single_file_.reset();
        files_seen_ = 1;
        bytes_seen_ = task.size;
        return task;
    }

    while (!stack_.empty()) {
        token_.throw_if_cancelled();
        Frame& top = stack_.back();

        if (top.next_file < top.files.size()) {
            FileTask task = make_task(top, top.files[top.next_file++]);
            files_seen_++;
            bytes_seen_ += task.size;
            return task;
        }

        if (top.next_dir < top.subdirs.size()) {
            const std::string& name = top.subdirs[top.next_dir++];
            std::string absolute = (fs::path(top.absolute) / name).string();
            std::string relative = top.relative.empty()
                ? name
                : (fs::path(top.relative) / name).string();

            EntryInfo info;
            std::error_code ec = fs_.stat(absolute, info);
            if (ec) {
                Logger::warn("[Enumerator] Folder vanished during scan: " + absolute);
                continue;
            }
            // top may dangle after this call
            push_directory(absolute, relative, info, false);
            continue;
        }

        stack_.pop_back();
    }

    finished_ = true;
    Logger::debug("[Enumerator] Finished: " + std::to_string(files_seen_) + " files, " +
                  std::to_string(bytes_seen_) + " bytes");
    return std::nullopt;
}

} // namespace ferry
