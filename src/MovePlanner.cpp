#include "MovePlanner.hpp"

#include "Sanitizer.hpp"

#include <iomanip>
#include <sstream>

namespace {
// Extension without the leading dot; handles names the path accessor reports as extension-less (".flac").
std::string extensionOf(const std::filesystem::path& source) {
    std::string extension = source.extension().string();
    if (!extension.empty()) {
        return extension.substr(1);
    }

    const std::string name = source.filename().string();
    const auto dot = name.rfind('.');
    if (dot == std::string::npos) {
        return {};
    }
    return name.substr(dot + 1);
}

std::string titleFor(const std::filesystem::path& source, const TrackMetadata& metadata) {
    if (metadata.title) {
        return sanitize(*metadata.title);
    }

    std::string stem = source.stem().string();
    return stem.empty() ? std::string("Unknown") : stem;
}
} // namespace

PlannedMove computeDestination(const std::filesystem::path& sortRoot,
                               const std::filesystem::path& source,
                               const TrackMetadata& metadata) {
    PlannedMove planned;
    planned.source = source;
    planned.folderName = sanitize(metadata.artist) + " - " + sanitize(metadata.album);

    std::ostringstream fileName;
    if (metadata.trackNumber) {
        fileName << std::setw(2) << std::setfill('0') << *metadata.trackNumber << " - ";
    }
    fileName << titleFor(source, metadata);

    const std::string extension = extensionOf(source);
    if (!extension.empty()) {
        fileName << '.' << extension;
    }

    planned.fileName = fileName.str();
    planned.dest = sortRoot / planned.folderName / planned.fileName;
    return planned;
}

PlannedMove computeUnsortedDestination(const std::filesystem::path& sortRoot, const std::filesystem::path& source) {
    PlannedMove planned;
    planned.source = source;
    planned.folderName = kUnsortedFolder;
    planned.fileName = source.filename().string();
    if (planned.fileName.empty()) {
        planned.fileName = "unknown";
    }
    planned.dest = sortRoot / planned.folderName / planned.fileName;
    return planned;
}
