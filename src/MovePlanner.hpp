#ifndef MOVE_PLANNER_HPP
#define MOVE_PLANNER_HPP

#include "TrackMetadata.hpp"

#include <filesystem>
#include <string>

// Folder that receives files whose tags could not be read.
constexpr char kUnsortedFolder[] = "_Unsorted";

// One intended relocation. dest is always sortRoot / folderName / fileName.
struct PlannedMove {
    std::filesystem::path source;
    std::filesystem::path dest;
    std::string folderName;
    std::string fileName;
    // Set by resolveConflicts when no free name was found within the attempt limit.
    bool conflictUnresolved = false;

    bool isNoOp() const { return source == dest; }
};

// Plan "Artist - Album/NN - Title.ext" for a file with readable tags.
// A source with no extension at all yields "NN - Title" with no trailing dot, not "NN - Title.".
// The scanner only passes files with an audio extension, so this form comes from direct callers.
PlannedMove computeDestination(const std::filesystem::path& sortRoot,
                               const std::filesystem::path& source,
                               const TrackMetadata& metadata);

// Plan "_Unsorted/<original name>" for a file without usable tags.
PlannedMove computeUnsortedDestination(const std::filesystem::path& sortRoot, const std::filesystem::path& source);

#endif
