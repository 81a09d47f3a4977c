#include "MediaProbe.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace hs;

TEST_CASE("Demuxer names map to mime types", "[media]") {
    CHECK(MediaProbe::mime_type_for("mov,mp4,m4a,3gp,3g2,mj2") == "video/mp4");
    CHECK(MediaProbe::mime_type_for("matroska,webm") == "video/webm");
    CHECK(MediaProbe::mime_type_for("matroska") == "video/x-matroska");
    CHECK(MediaProbe::mime_type_for("ogg") == "video/ogg");
    CHECK(MediaProbe::mime_type_for("avi") == "video/x-msvideo");
    CHECK(MediaProbe::mime_type_for("") == "application/octet-stream");
    // Whole names only.
    CHECK(MediaProbe::mime_type_for("mp4x,movie") == "application/octet-stream");
}

TEST_CASE("Probing a missing file throws", "[media]") {
    MediaProbe probe;
    REQUIRE_THROWS_AS(probe.probe("/nonexistent/clip.mp4"), std::runtime_error);
    REQUIRE_THROWS_AS(probe.load("/nonexistent/clip.mp4", "media_1"), std::runtime_error);
}
