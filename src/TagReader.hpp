#ifndef TAG_READER_HPP
#define TAG_READER_HPP

#include "TrackMetadata.hpp"

#include <filesystem>
#include <optional>

// Read artist/album/title/track from an audio file's tags.
// Returns empty when the file cannot be parsed or artist or album is missing.
std::optional<TrackMetadata> readTags(const std::filesystem::path& file);

#endif
