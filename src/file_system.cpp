#include "file_system.hpp"

#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace ferry {

namespace {

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

void fill_entry(const struct stat& st, EntryInfo& out) {
    if (S_ISREG(st.st_mode)) {
        out.type = EntryType::Regular;
    } else if (S_ISDIR(st.st_mode)) {
        out.type = EntryType::Directory;
    } else if (S_ISLNK(st.st_mode)) {
        out.type = EntryType::Symlink;
    } else {
        out.type = EntryType::Other;
    }
    out.size = static_cast<uint64_t>(st.st_size);
    out.device = static_cast<uint64_t>(st.st_dev);
    out.inode = static_cast<uint64_t>(st.st_ino);
    out.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
}

class PosixReader : public FileReader {
public:
    explicit PosixReader(int fd) : fd_(fd) {}
    ~PosixReader() override {
        if (fd_ >= 0) ::close(fd_);
    }

    size_t read(char* buffer, size_t length, std::error_code& ec) override {
        ec.clear();
        for (;;) {
            ssize_t n = ::read(fd_, buffer, length);
            if (n >= 0) return static_cast<size_t>(n);
            if (errno == EINTR) continue;
            ec = last_error();
            return 0;
        }
    }

private:
    int fd_;
};

class PosixWriter : public FileWriter {
public:
    explicit PosixWriter(int fd) : fd_(fd) {}
    ~PosixWriter() override {
        if (fd_ >= 0) ::close(fd_);
    }

    bool write(const char* data, size_t length, std::error_code& ec) override {
        ec.clear();
        size_t written = 0;
        while (written < length) {
            ssize_t n = ::write(fd_, data + written, length - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                ec = last_error();
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

    std::error_code close() override {
        if (fd_ < 0) return {};
        std::error_code ec;
        if (::fsync(fd_) != 0 && errno != EINVAL && errno != EROFS) {
            ec = last_error();
        }
        if (::close(fd_) != 0 && !ec) {
            ec = last_error();
        }
        fd_ = -1;
        return ec;
    }

private:
    int fd_;
};

} // namespace

std::error_code PosixFileSystem::stat(const std::string& path, EntryInfo& out) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return last_error();
    fill_entry(st, out);
    return {};
}

std::error_code PosixFileSystem::lstat(const std::string& path, EntryInfo& out) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) return last_error();
    fill_entry(st, out);
    return {};
}

std::error_code PosixFileSystem::list_directory(const std::string& path,
                                                std::vector<std::string>& names) {
    names.clear();
    DIR* dir = ::opendir(path.c_str());
    if (!dir) return last_error();

    errno = 0;
    while (struct dirent* entry = ::readdir(dir)) {
        if (std::strcmp(entry->d_name, ".") == 0 || std::strcmp(entry->d_name, "..") == 0) {
            continue;
        }
        names.emplace_back(entry->d_name);
    }
    std::error_code ec;
    if (errno != 0) ec = last_error();
    ::closedir(dir);
    return ec;
}

std::unique_ptr<FileReader> PosixFileSystem::open_read(const std::string& path, std::error_code& ec) {
    ec.clear();
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        ec = last_error();
        return nullptr;
    }
    return std::make_unique<PosixReader>(fd);
}

std::unique_ptr<FileWriter> PosixFileSystem::open_write(const std::string& path, std::error_code& ec) {
    ec.clear();
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        ec = last_error();
        return nullptr;
    }
    return std::make_unique<PosixWriter>(fd);
}

std::error_code PosixFileSystem::remove(const std::string& path) {
    if (::unlink(path.c_str()) != 0) return last_error();
    return {};
}

std::error_code PosixFileSystem::rename(const std::string& from, const std::string& to) {
    if (::rename(from.c_str(), to.c_str()) != 0) return last_error();
    return {};
}

std::error_code PosixFileSystem::create_directories(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return ec;
}

std::error_code PosixFileSystem::free_space(const std::string& path, uint64_t& out) {
    struct statvfs vfs;
    if (::statvfs(path.c_str(), &vfs) != 0) return last_error();
    out = static_cast<uint64_t>(vfs.f_bavail) * static_cast<uint64_t>(vfs.f_frsize);
    return {};
}

std::error_code PosixFileSystem::set_mtime(const std::string& path, int64_t mtime_ns) {
    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = static_cast<time_t>(mtime_ns / 1000000000LL);
    times[1].tv_nsec = static_cast<long>(mtime_ns % 1000000000LL);
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) return last_error();
    return {};
}

} // namespace ferry
