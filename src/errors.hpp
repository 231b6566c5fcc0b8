#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace ferry {

/**
 * Base of every error the transfer engine raises.
 */
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Source root missing, unreadable, or a symbolic-link cycle was found.
 * Aborts the job before any file is transferred.
 */
class EnumerationError : public TransferError {
public:
    explicit EnumerationError(const std::string& message)
        : TransferError(message) {}
};

enum class FileErrorKind {
    PermissionDenied,
    NotFound,
    ReadFailed,
    WriteFailed,
    ChecksumMismatch,
    Other
};

const char* file_error_kind_name(FileErrorKind kind);

/**
 * Failure confined to one file. Recorded on the task; the job continues.
 */
class PerFileError : public TransferError {
public:
    PerFileError(FileErrorKind kind, const std::string& message, std::error_code ec = {})
        : TransferError(message), kind_(kind), code_(ec) {}

    FileErrorKind kind() const { return kind_; }
    const std::error_code& code() const { return code_; }

private:
    FileErrorKind kind_;
    std::error_code code_;
};

/**
 * Destination volume gone or full. Remaining tasks stay Pending and the
 * job ends Failed.
 */
class JobFatalError : public TransferError {
public:
    explicit JobFatalError(const std::string& message, std::error_code ec = {})
        : TransferError(message), code_(ec) {}

    const std::error_code& code() const { return code_; }

private:
    std::error_code code_;
};

/**
 * Raised at a cancellation checkpoint. Not a failure.
 */
class CancelledError : public TransferError {
public:
    CancelledError()
        : TransferError("Transfer cancelled") {}
};

// errno values on the destination side that end the whole job
bool is_destination_fatal(const std::error_code& ec);

// Maps an I/O error on a single file to a per-file error kind
FileErrorKind classify_file_error(const std::error_code& ec, bool writing);

} // namespace ferry
