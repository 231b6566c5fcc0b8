#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace ferry {

enum class EntryType {
    Regular,
    Directory,
    Symlink,
    Other
};

struct EntryInfo {
    EntryType type = EntryType::Other;
    uint64_t size = 0;
    uint64_t device = 0;
    uint64_t inode = 0;
    int64_t mtime_ns = 0;
};

class FileReader {
public:
    virtual ~FileReader() = default;
    // Returns bytes read; 0 with no error means end of file
    virtual size_t read(char* buffer, size_t length, std::error_code& ec) = 0;
};

class FileWriter {
public:
    virtual ~FileWriter() = default;
    virtual bool write(const char* data, size_t length, std::error_code& ec) = 0;
    // Flushes and closes; reports deferred write errors
    virtual std::error_code close() = 0;
};

/**
 * Operating-system primitives the engine depends on.
 *
 * Every call reports failures through std::error_code and never throws.
 * The engine only talks to the disk through this interface.
 */
class FileSystemOps {
public:
    virtual ~FileSystemOps() = default;

    // stat() follows symbolic links, lstat() does not
    virtual std::error_code stat(const std::string& path, EntryInfo& out) = 0;
    virtual std::error_code lstat(const std::string& path, EntryInfo& out) = 0;
    virtual std::error_code list_directory(const std::string& path,
                                           std::vector<std::string>& names) = 0;

    virtual std::unique_ptr<FileReader> open_read(const std::string& path, std::error_code& ec) = 0;
    virtual std::unique_ptr<FileWriter> open_write(const std::string& path, std::error_code& ec) = 0;

    virtual std::error_code remove(const std::string& path) = 0;
    virtual std::error_code rename(const std::string& from, const std::string& to) = 0;
    virtual std::error_code create_directories(const std::string& path) = 0;

    // Bytes available to an unprivileged writer on the volume holding path
    virtual std::error_code free_space(const std::string& path, uint64_t& out) = 0;
    virtual std::error_code set_mtime(const std::string& path, int64_t mtime_ns) = 0;
};

/**
 * FileSystemOps over POSIX calls.
 */
class PosixFileSystem : public FileSystemOps {
public:
    std::error_code stat(const std::string& path, EntryInfo& out) override;
    std::error_code lstat(const std::string& path, EntryInfo& out) override;
    std::error_code list_directory(const std::string& path,
                                   std::vector<std::string>& names) override;

    std::unique_ptr<FileReader> open_read(const std::string& path, std::error_code& ec) override;
    std::unique_ptr<FileWriter> open_write(const std::string& path, std::error_code& ec) override;

    std::error_code remove(const std::string& path) override;
    std::error_code rename(const std::string& from, const std::string& to) override;
    std::error_code create_directories(const std::string& path) override;

    std::error_code free_space(const std::string& path, uint64_t& out) override;
    std::error_code set_mtime(const std::string& path, int64_t mtime_ns) override;
};

} // namespace ferry
