#include "HighlightService.hpp"
#include "TestSupport.hpp"

#include <catch2/catch.hpp>

using namespace hs;
using namespace hs::test;

TEST_CASE("Selected sentences in selection and time order", "[highlight]") {
    Transcript t = make_transcript("transcript_1", "media_1");
    HighlightSet h = make_highlight("highlight_1", "media_1", {"s4", "ghost", "s1", "s3"});

    auto by_selection = HighlightService::selected_sentences(h, t, SentenceOrder::selection);
    REQUIRE(by_selection.size() == 3);
    CHECK(by_selection[0].id == "s4");
    CHECK(by_selection[1].id == "s1");
    CHECK(by_selection[2].id == "s3");

    auto by_time = HighlightService::selected_sentences(h, t, SentenceOrder::time);
    REQUIRE(by_time.size() == 3);
    CHECK(by_time[0].id == "s1");
    CHECK(by_time[1].id == "s3");
    CHECK(by_time[2].id == "s4");
}

TEST_CASE("Time ranges and total duration", "[highlight]") {
    Transcript t = make_transcript("transcript_1", "media_1");
    HighlightSet h = make_highlight("highlight_1", "media_1", {"s2", "s1"});

    auto ranges = HighlightService::time_ranges(h, t, SentenceOrder::time);
    REQUIRE(ranges.size() == 2);
    CHECK(ranges[0].start_ms == 0);
    CHECK(ranges[1].end_ms == 2500);

    CHECK(HighlightService::total_duration_ms(h, t) == 2500);

    HighlightSet empty = make_highlight("highlight_2", "media_1", {});
    CHECK(HighlightService::total_duration_ms(empty, t) == 0);
}
