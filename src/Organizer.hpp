#ifndef ORGANIZER_HPP
#define ORGANIZER_HPP

#include "FileMover.hpp"
#include "MovePlanner.hpp"
#include "TrackMetadata.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <vector>

using TagReaderFn = std::function<std::optional<TrackMetadata>(const std::filesystem::path&)>;

struct MoveSummary {
    std::size_t moved = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
};

// Plans a whole batch under one sort root, previews it, and executes it in order.
class Organizer {
public:
    explicit Organizer(std::filesystem::path sortRoot);
    Organizer(std::filesystem::path sortRoot, TagReaderFn tagReader, FileMover mover);

    // Build and conflict-resolve the plan for files (expected sorted by path).
    void plan(const std::vector<std::filesystem::path>& files);
    // Print the plan grouped by destination folder plus a one-line summary.
    void printPreview(std::ostream& out) const;
    // Run every pending move in plan order; failures are logged and counted, not fatal.
    MoveSummary executeAll() const;

    const std::vector<PlannedMove>& plannedMoves() const { return m_moves; }
    std::size_t unresolvedConflicts() const { return m_unresolved; }

private:
    std::filesystem::path m_sortRoot;
    TagReaderFn m_tagReader;
    FileMover m_mover;
    std::vector<PlannedMove> m_moves;
    std::size_t m_unresolved = 0;
};

#endif
