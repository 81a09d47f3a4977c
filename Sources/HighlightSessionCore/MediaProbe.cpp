#include "MediaProbe.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <vector>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}

namespace hs {

namespace {

std::string av_error_text(int ret) {
    char errbuf[256];
    av_strerror(ret, errbuf, sizeof(errbuf));
    return errbuf;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

MediaProbe::MediaProbe() = default;
MediaProbe::~MediaProbe() = default;

// ---------------------------------------------------------------------------
// probe
// ---------------------------------------------------------------------------

MediaMetadata MediaProbe::probe(const std::string& path) const {
    MediaMetadata meta;

    // 1. Open input file
    AVFormatContext* fmt_ctx = nullptr;
    int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw std::runtime_error("Failed to open media file '" + path + "': " + av_error_text(ret));
    }

    ret = avformat_find_stream_info(fmt_ctx, nullptr);
    if (ret < 0) {
        avformat_close_input(&fmt_ctx);
        throw std::runtime_error("Failed to find stream info in '" + path + "': " + av_error_text(ret));
    }

    // 2. Find the video stream
    int video_idx = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (video_idx < 0) {
        avformat_close_input(&fmt_ctx);
        throw std::runtime_error("No video stream found in '" + path + "'");
    }
    const AVStream* stream = fmt_ctx->streams[video_idx];

    // 3. Collect metadata
    if (fmt_ctx->duration != AV_NOPTS_VALUE) {
        meta.duration_seconds = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
    } else if (stream->duration != AV_NOPTS_VALUE) {
        meta.duration_seconds = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    }
    meta.width  = stream->codecpar->width;
    meta.height = stream->codecpar->height;
    meta.mime_type = mime_type_for(fmt_ctx->iformat->name ? fmt_ctx->iformat->name : "");

    avformat_close_input(&fmt_ctx);

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to stat '" + path + "': " + ec.message());
    }
    meta.size_bytes = static_cast<uint64_t>(size);
    meta.name = std::filesystem::path(path).filename().string();

    return meta;
}

// ---------------------------------------------------------------------------
// load
// ---------------------------------------------------------------------------

Media MediaProbe::load(const std::string& path, const std::string& id) const {
    Media media;
    media.id = id;
    media.metadata = probe(path);

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to read media file '" + path + "'");
    }
    auto bytes = std::make_shared<std::vector<uint8_t>>(
        std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    media.bytes = std::move(bytes);

    return media;
}

// ---------------------------------------------------------------------------
// mime_type_for  (static)
// ---------------------------------------------------------------------------

std::string MediaProbe::mime_type_for(const std::string& format_names) {
    // libavformat reports a comma-separated list for multi-format demuxers.
    auto has = [&](const char* name) {
        const std::string needle(name);
        std::size_t pos = 0;
        while ((pos = format_names.find(needle, pos)) != std::string::npos) {
            const bool starts = pos == 0 || format_names[pos - 1] == ',';
            const std::size_t end = pos + needle.size();
            const bool ends = end == format_names.size() || format_names[end] == ',';
            if (starts && ends) return true;
            pos = end;
        }
        return false;
    };

    if (has("mp4") || has("mov")) return "video/mp4";
    if (has("webm"))              return "video/webm";
    if (has("matroska"))          return "video/x-matroska";
    if (has("ogg"))               return "video/ogg";
    if (has("avi"))               return "video/x-msvideo";
    return "application/octet-stream";
}

} // namespace hs
