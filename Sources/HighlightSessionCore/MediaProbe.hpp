#pragma once

#include "Types.hpp"

#include <string>

namespace hs {

/// Reads container metadata of a media file with FFmpeg's libavformat.
/// Nothing is decoded; only the headers and stream info are parsed.
class MediaProbe {
public:
    MediaProbe();
    ~MediaProbe();

    // Non-copyable.
    MediaProbe(const MediaProbe&) = delete;
    MediaProbe& operator=(const MediaProbe&) = delete;

    /// Duration, dimensions of the best video stream, file size, mime type
    /// and file name.  Throws std::runtime_error with the libav error text.
    MediaMetadata probe(const std::string& path) const;

    /// probe() plus the file contents as the Media payload.
    Media load(const std::string& path, const std::string& id) const;

    /// Mime type for a libavformat demuxer name list ("mov,mp4,m4a,...").
    static std::string mime_type_for(const std::string& format_names);
};

} // namespace hs
