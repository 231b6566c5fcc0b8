#include "errors.hpp"

#include <cerrno>

namespace ferry {

const char* file_error_kind_name(FileErrorKind kind) {
    switch (kind) {
        case FileErrorKind::PermissionDenied: return "permission denied";
        case FileErrorKind::NotFound:         return "not found";
        case FileErrorKind::ReadFailed:       return "read failed";
        case FileErrorKind::WriteFailed:      return "write failed";
        case FileErrorKind::ChecksumMismatch: return "checksum mismatch";
        case FileErrorKind::Other:            return "error";
    }
    return "error";
}

bool is_destination_fatal(const std::error_code& ec) {
    if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
        return false;
    }
    switch (ec.value()) {
        case ENOSPC:
        case EDQUOT:
        case ENODEV:
        case ENXIO:
        case EROFS:
            return true;
        default:
            return false;
    }
}

FileErrorKind classify_file_error(const std::error_code& ec, bool writing) {
    switch (ec.value()) {
        case EACCES:
        case EPERM:
            return FileErrorKind::PermissionDenied;
        case ENOENT:
        case ENOTDIR:
            return FileErrorKind::NotFound;
        default:
            return writing ? FileErrorKind::WriteFailed : FileErrorKind::ReadFailed;
    }
}

} // namespace ferry
