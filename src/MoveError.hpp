#ifndef MOVE_ERROR_HPP
#define MOVE_ERROR_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

enum class MoveErrorKind {
    DestinationExists,
    ConflictUnresolved,
    CopyVerificationFailed,
    CrossDevice,
    PermissionDenied,
    NotFound,
    Io
};

const char* toString(MoveErrorKind kind);

// Reduce a platform error to the few kinds the mover branches on.
MoveErrorKind classifyIoError(const std::error_code& ec);

struct MoveError {
    MoveErrorKind kind = MoveErrorKind::Io;
    std::filesystem::path source;
    std::filesystem::path destination;
    std::error_code code;
    std::string message;
};

// Outcome of one move: success, or exactly one MoveError.
class MoveResult {
public:
    static MoveResult success();
    static MoveResult failure(MoveError error);

    bool ok() const { return !m_error.has_value(); }
    // Only valid when ok() is false.
    const MoveError& error() const { return *m_error; }

private:
    std::optional<MoveError> m_error;
};

#endif
