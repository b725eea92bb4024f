#include "ConflictResolver.hpp"

#include "PathProbe.hpp"

#include <iostream>
#include <set>
#include <string>
#include <system_error>
#include <utility>

namespace {
std::filesystem::path withDisambiguator(const std::filesystem::path& dest, std::size_t attempt) {
    const std::string stem = dest.stem().string();
    const std::string extension = dest.extension().string();
    return dest.parent_path() / (stem + " (" + std::to_string(attempt) + ")" + extension);
}

bool isTaken(const std::filesystem::path& candidate, const std::set<std::filesystem::path>& claimed) {
    if (claimed.count(candidate) != 0) {
        return true;
    }

    std::error_code ec;
    const bool occupied = pathOccupied(candidate, ec);
    // A path whose status cannot be read is not assumed free.
    return occupied || ec;
}
} // namespace

std::size_t resolveConflicts(std::vector<PlannedMove>& batch, std::size_t maxAttempts) {
    std::set<std::filesystem::path> claimed;
    std::size_t unresolved = 0;

    for (auto& planned : batch) {
        if (planned.isNoOp()) {
            continue;
        }

        std::filesystem::path candidate = planned.dest;
        std::size_t attempt = 0;
        bool exhausted = false;
        while (isTaken(candidate, claimed)) {
            if (attempt == maxAttempts) {
                exhausted = true;
                break;
            }
            ++attempt;
            candidate = withDisambiguator(planned.dest, attempt);
        }

        if (candidate != planned.dest) {
            planned.fileName = candidate.filename().string();
            planned.dest = candidate;
        }

        if (exhausted) {
            planned.conflictUnresolved = true;
            ++unresolved;
            std::cerr << "Warning: no free name for `" << planned.source.string() << "` after " << maxAttempts
                      << " attempt(s); it will not be moved." << std::endl;
        }

        claimed.insert(std::move(candidate));
    }

    return unresolved;
}
