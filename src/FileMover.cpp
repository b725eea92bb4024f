#include "FileMover.hpp"

#include "PathProbe.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace {
MoveResult fail(const PlannedMove& planned, MoveErrorKind kind, std::error_code code, std::string message) {
    MoveError error;
    error.kind = kind;
    error.source = planned.source;
    error.destination = planned.dest;
    error.code = code;
    error.message = std::move(message);
    return MoveResult::failure(std::move(error));
}

std::string describe(const PlannedMove& planned) {
    return "`" + planned.source.string() + "` -> `" + planned.dest.string() + "`";
}
} // namespace

FileMover::FileMover(MoveHooks hooks) : m_hooks(std::move(hooks)) {}

MoveResult FileMover::executeMove(const PlannedMove& planned) const {
    if (planned.isNoOp()) {
        return MoveResult::success();
    }

    if (planned.conflictUnresolved) {
        return fail(planned, MoveErrorKind::ConflictUnresolved, {},
                    "No free destination name was found for " + describe(planned));
    }

    const auto parent = planned.dest.parent_path();
    if (!parent.empty()) {
        std::error_code mkdirErr;
        std::filesystem::create_directories(parent, mkdirErr);
        if (mkdirErr) {
            return fail(planned, classifyIoError(mkdirErr), mkdirErr,
                        "Failed to create destination directory `" + parent.string() + "`: " + mkdirErr.message());
        }
    }

    // Planning may be stale; another process can have claimed the name since.
    std::error_code probeErr;
    const bool occupied = pathOccupied(planned.dest, probeErr);
    if (probeErr) {
        return fail(planned, classifyIoError(probeErr), probeErr,
                    "Unable to check destination `" + planned.dest.string() + "`: " + probeErr.message());
    }
    if (occupied) {
        return fail(planned, MoveErrorKind::DestinationExists, std::make_error_code(std::errc::file_exists),
                    "Destination already exists (appeared after planning): `" + planned.dest.string() + "`");
    }

    std::error_code renameErr;
    renamePath(planned.source, planned.dest, renameErr);
    if (!renameErr) {
        return MoveResult::success();
    }

    const MoveErrorKind kind = classifyIoError(renameErr);
    if (kind != MoveErrorKind::CrossDevice) {
        return fail(planned, kind, renameErr, "Failed to move " + describe(planned) + ": " + renameErr.message());
    }

    return moveAcrossDevices(planned);
}

MoveResult FileMover::moveAcrossDevices(const PlannedMove& planned) const {
    std::error_code sizeErr;
    const std::uintmax_t sourceSize = std::filesystem::file_size(planned.source, sizeErr);
    if (sizeErr) {
        return fail(planned, classifyIoError(sizeErr), sizeErr,
                    "Failed to read source size `" + planned.source.string() + "`: " + sizeErr.message());
    }

    std::error_code copyErr;
    const std::uintmax_t copied = copyPath(planned.source, planned.dest, copyErr);
    if (copyErr) {
        if (copyErr == std::errc::file_exists) {
            // Someone else's file; leave it alone.
            return fail(planned, MoveErrorKind::DestinationExists, copyErr,
                        "Destination already exists (appeared during copy): `" + planned.dest.string() + "`");
        }
        discardPartialCopy(planned.dest);
        return fail(planned, classifyIoError(copyErr), copyErr,
                    "Failed to copy " + describe(planned) + ": " + copyErr.message());
    }

    if (copied != sourceSize) {
        discardPartialCopy(planned.dest);
        return fail(planned, MoveErrorKind::CopyVerificationFailed, {},
                    "Copy verification failed for `" + planned.source.string() + "`: expected " +
                        std::to_string(sourceSize) + " bytes, copied " + std::to_string(copied));
    }

    std::error_code removeErr;
    removeSourcePath(planned.source, removeErr);
    if (removeErr) {
        return fail(planned, classifyIoError(removeErr), removeErr,
                    "Copied to `" + planned.dest.string() + "` but failed to remove original `" +
                        planned.source.string() + "`: " + removeErr.message());
    }

    std::cout << "Copied " << describe(planned) << " (cross-device move)" << std::endl;
    return MoveResult::success();
}

void FileMover::renamePath(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) const {
    if (m_hooks.rename) {
        m_hooks.rename(from, to, ec);
        return;
    }
    std::filesystem::rename(from, to, ec);
}

std::uintmax_t FileMover::copyPath(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) const {
    if (m_hooks.copy) {
        return m_hooks.copy(from, to, ec);
    }

    std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, ec);
    if (ec) {
        return 0;
    }
    return std::filesystem::file_size(to, ec);
}

void FileMover::removeSourcePath(const std::filesystem::path& source, std::error_code& ec) const {
    if (m_hooks.removeSource) {
        m_hooks.removeSource(source, ec);
        return;
    }
    std::filesystem::remove(source, ec);
}

void FileMover::discardPartialCopy(const std::filesystem::path& dest) {
    std::error_code removeErr;
    std::filesystem::remove(dest, removeErr);
    if (removeErr) {
        std::cerr << "Failed to remove incomplete copy `" << dest.string() << "`: " << removeErr.message() << std::endl;
    }
}
