#include "MoveError.hpp"

#include <utility>

const char* toString(MoveErrorKind kind) {
    switch (kind) {
    case MoveErrorKind::DestinationExists:
        return "destination exists";
    case MoveErrorKind::ConflictUnresolved:
        return "conflict unresolved";
    case MoveErrorKind::CopyVerificationFailed:
        return "copy verification failed";
    case MoveErrorKind::CrossDevice:
        return "cross-device";
    case MoveErrorKind::PermissionDenied:
        return "permission denied";
    case MoveErrorKind::NotFound:
        return "not found";
    case MoveErrorKind::Io:
        return "i/o error";
    }
    return "unknown";
}

MoveErrorKind classifyIoError(const std::error_code& ec) {
    if (ec == std::errc::cross_device_link) {
        return MoveErrorKind::CrossDevice;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return MoveErrorKind::PermissionDenied;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return MoveErrorKind::NotFound;
    }
    return MoveErrorKind::Io;
}

MoveResult MoveResult::success() {
    return MoveResult{};
}

MoveResult MoveResult::failure(MoveError error) {
    MoveResult result;
    result.m_error = std::move(error);
    return result;
}
