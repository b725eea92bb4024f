#ifndef TRACK_METADATA_HPP
#define TRACK_METADATA_HPP

#include <optional>
#include <string>

// Tag fields needed to place a track. Artist and album are never empty.
struct TrackMetadata {
    std::string artist;
    std::string album;
    std::optional<std::string> title;
    std::optional<unsigned int> trackNumber;
};

#endif
