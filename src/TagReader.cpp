#include "TagReader.hpp"

#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/tstring.h>

#include <string>
#include <utility>

namespace {
std::string toUtf8(const TagLib::String& value) {
    return value.to8Bit(true);
}
} // namespace

std::optional<TrackMetadata> readTags(const std::filesystem::path& file) {
    TagLib::FileRef ref(file.c_str());
    if (ref.isNull() || ref.tag() == nullptr) {
        return std::nullopt;
    }

    const TagLib::Tag* tag = ref.tag();
    TrackMetadata metadata;
    metadata.artist = toUtf8(tag->artist());
    metadata.album = toUtf8(tag->album());
    if (metadata.artist.empty() || metadata.album.empty()) {
        return std::nullopt;
    }

    std::string title = toUtf8(tag->title());
    if (!title.empty()) {
        metadata.title = std::move(title);
    }

    // TagLib reports 0 when the track field is absent.
    if (tag->track() != 0) {
        metadata.trackNumber = tag->track();
    }
    return metadata;
}
