#include "Organizer.hpp"

#include "ConflictResolver.hpp"
#include "TagReader.hpp"

#include <iostream>
#include <map>
#include <string>
#include <utility>

Organizer::Organizer(std::filesystem::path sortRoot) : Organizer(std::move(sortRoot), readTags, FileMover{}) {}

Organizer::Organizer(std::filesystem::path sortRoot, TagReaderFn tagReader, FileMover mover)
    : m_sortRoot(std::move(sortRoot)), m_tagReader(std::move(tagReader)), m_mover(std::move(mover)) {}

void Organizer::plan(const std::vector<std::filesystem::path>& files) {
    m_moves.clear();
    m_moves.reserve(files.size());
    for (const auto& file : files) {
        if (auto metadata = m_tagReader(file)) {
            m_moves.push_back(computeDestination(m_sortRoot, file, *metadata));
        } else {
            m_moves.push_back(computeUnsortedDestination(m_sortRoot, file));
        }
    }

    m_unresolved = resolveConflicts(m_moves);
}

void Organizer::printPreview(std::ostream& out) const {
    std::map<std::string, std::vector<const PlannedMove*>> folders;
    for (const auto& planned : m_moves) {
        folders[planned.folderName].push_back(&planned);
    }

    std::size_t moveCount = 0;
    std::size_t unsortedCount = 0;
    std::size_t skippedCount = 0;
    for (const auto& [folder, entries] : folders) {
        const bool unsorted = folder == kUnsortedFolder;
        out << "  " << folder << (unsorted ? "" : "/") << '\n';

        for (const auto* planned : entries) {
            if (planned->isNoOp()) {
                ++skippedCount;
                out << "    " << planned->fileName << "  (already in place)" << '\n';
                continue;
            }

            out << "    " << planned->fileName << "  <- " << planned->source.filename().string();
            if (planned->conflictUnresolved) {
                out << "  (name conflict, will be skipped)";
            }
            out << '\n';

            if (unsorted) {
                ++unsortedCount;
            } else {
                ++moveCount;
            }
        }
        out << '\n';
    }

    const std::size_t folderCount = folders.size() - folders.count(kUnsortedFolder);
    out << "Summary: " << (moveCount + unsortedCount + skippedCount) << " files -> " << folderCount << " folders, "
        << unsortedCount << " unsorted";
    if (skippedCount > 0) {
        out << ", " << skippedCount << " already in place";
    }
    out << std::endl;
}

MoveSummary Organizer::executeAll() const {
    MoveSummary summary;
    for (const auto& planned : m_moves) {
        if (planned.isNoOp()) {
            ++summary.skipped;
            continue;
        }

        const MoveResult result = m_mover.executeMove(planned);
        if (result.ok()) {
            ++summary.moved;
            continue;
        }

        const MoveError& error = result.error();
        std::cerr << "ERROR [" << toString(error.kind) << "] " << error.message << std::endl;
        ++summary.failed;
    }
    return summary;
}
