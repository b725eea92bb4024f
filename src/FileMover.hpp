#ifndef FILE_MOVER_HPP
#define FILE_MOVER_HPP

#include "MoveError.hpp"
#include "MovePlanner.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <system_error>

// Replacements for the filesystem primitives, used by tests to simulate
// cross-device renames and short copies. Empty members use std::filesystem.
struct MoveHooks {
    std::function<void(const std::filesystem::path&, const std::filesystem::path&, std::error_code&)> rename;
    // Returns the number of bytes written to the destination.
    std::function<std::uintmax_t(const std::filesystem::path&, const std::filesystem::path&, std::error_code&)> copy;
    // Deletes the source after a verified cross-device copy.
    std::function<void(const std::filesystem::path&, std::error_code&)> removeSource;
};

// Executes resolved move plans one at a time.
class FileMover {
public:
    FileMover() = default;
    explicit FileMover(MoveHooks hooks);

    // Rename source to dest, creating parent folders. Falls back to copy, verify, delete
    // only when the rename crosses filesystems. Never overwrites and never removes the
    // source before the copy is verified.
    MoveResult executeMove(const PlannedMove& planned) const;

private:
    void renamePath(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) const;
    std::uintmax_t copyPath(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) const;
    void removeSourcePath(const std::filesystem::path& source, std::error_code& ec) const;
    // Copy, verify the byte count, then delete the source.
    MoveResult moveAcrossDevices(const PlannedMove& planned) const;
    // Remove an incomplete destination copy, reporting (not failing) if that is impossible.
    static void discardPartialCopy(const std::filesystem::path& dest);

    MoveHooks m_hooks;
};

#endif
