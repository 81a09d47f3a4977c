#include "EntityCodec.hpp"
#include "MemoryStorageTier.hpp"
#include "SessionRegistry.hpp"
#include "StaleSessionReaper.hpp"
#include "TestSupport.hpp"

#include <catch2/catch.hpp>

using namespace hs;
using namespace hs::test;

namespace {

const std::string kOld   = "session_1699000000000_oldoldold";
const std::string kFresh = "session_1699900000000_freshfres";

/// Writes one session with a media, transcript and highlight at `saved_at`.
void seed_session(StorageTier& storage, const std::string& session_id, int64_t saved_at) {
    const std::string media_id = "media_" + session_id;
    storage.put_durable(StoreKind::sessions, EntityCodec::encode_session({session_id, saved_at, saved_at}));
    storage.put_durable(StoreKind::media, EntityCodec::encode_media(make_media(media_id, 4), session_id,
                                                                    saved_at, StorageTierKind::full));
    storage.put_durable(StoreKind::transcripts,
                        EntityCodec::encode_transcript(make_transcript("transcript_" + session_id, media_id),
                                                       session_id, saved_at));
    storage.put_durable(StoreKind::highlights,
                        EntityCodec::encode_highlight_set(make_highlight("highlight_" + session_id, media_id, {"s1"}),
                                                          session_id, saved_at));
}

std::size_t records_of(StorageTier& storage, const std::string& session_id) {
    std::size_t n = 0;
    for (StoreKind store : {StoreKind::media, StoreKind::transcripts, StoreKind::highlights}) {
        n += storage.get_by_session(store, session_id).size();
    }
    return n + (storage.get_durable(StoreKind::sessions, session_id) ? 1 : 0);
}

struct ReaperFixture {
    FakeClock         clock;
    MemoryStorageTier memory;
    FaultyStorageTier storage{memory};
    SessionRegistry   registry{storage, clock.as_clock()};
    SessionContext    context{registry};
    StaleSessionReaper reaper{storage, context, 24 * kHourMs};

    ReaperFixture() { registry.open(); }
};

} // namespace

TEST_CASE("Sessions past the TTL are reaped, recent ones are kept", "[reaper]") {
    ReaperFixture f;
    seed_session(f.memory, kOld, f.clock.now - 25 * kHourMs);
    seed_session(f.memory, kFresh, f.clock.now - 23 * kHourMs);

    REQUIRE(records_of(f.memory, kOld) == 4);
    REQUIRE(records_of(f.memory, kFresh) == 4);

    ReapSummary summary = f.reaper.reap();

    CHECK(summary.sessions_reaped == 1);
    CHECK(summary.failures == 0);
    CHECK(records_of(f.memory, kOld) == 0);
    CHECK(records_of(f.memory, kFresh) == 4);
}

TEST_CASE("A session exactly at the TTL is kept", "[reaper]") {
    ReaperFixture f;
    seed_session(f.memory, kOld, f.clock.now - 24 * kHourMs);

    f.reaper.reap();
    CHECK(records_of(f.memory, kOld) == 4);

    f.clock.advance(1);
    f.reaper.reap();
    CHECK(records_of(f.memory, kOld) == 0);
}

TEST_CASE("The current session expires like any other", "[reaper]") {
    ReaperFixture f;
    seed_session(f.memory, f.registry.session_id(), f.clock.now);

    SessionRegistry reopened(f.storage, f.clock.as_clock());
    reopened.open();
    REQUIRE(reopened.current());

    f.clock.advance(25 * kHourMs);
    SessionContext context(reopened);
    StaleSessionReaper reaper(f.storage, context, 24 * kHourMs);
    reaper.reap();

    CHECK(records_of(f.memory, reopened.session_id()) == 0);
    CHECK_FALSE(reopened.current());
    // The id itself stays; the session simply starts empty.
    CHECK(reopened.is_open());
}

TEST_CASE("Malformed and undecodable sessions are reaped", "[reaper]") {
    ReaperFixture f;
    seed_session(f.memory, "legacy-session-7", f.clock.now);

    PersistenceRecord broken;
    broken.id = kFresh;
    broken.session_id = kFresh;
    broken.saved_at = f.clock.now;
    broken.payload = "{\"createdAt\":\"yesterday\"}";
    f.memory.put_durable(StoreKind::sessions, broken);

    ReapSummary summary = f.reaper.reap();
    CHECK(summary.sessions_reaped == 2);
    CHECK(records_of(f.memory, "legacy-session-7") == 0);
    CHECK_FALSE(f.memory.get_durable(StoreKind::sessions, kFresh));
}

TEST_CASE("Orphaned records are reaped, the current session's are not", "[reaper]") {
    ReaperFixture f;
    const std::string current = f.registry.session_id();

    // Entities without any SessionRecord.
    f.memory.put_durable(StoreKind::transcripts,
                         EntityCodec::encode_transcript(make_transcript("transcript_orphan", "media_x"),
                                                        kOld, f.clock.now));
    f.memory.put_durable(StoreKind::transcripts,
                         EntityCodec::encode_transcript(make_transcript("transcript_mine", "media_y"),
                                                        current, f.clock.now));

    f.reaper.reap();
    CHECK_FALSE(f.memory.get_durable(StoreKind::transcripts, "transcript_orphan"));
    CHECK(f.memory.get_durable(StoreKind::transcripts, "transcript_mine"));
}

TEST_CASE("Old records of a live session are kept", "[reaper]") {
    ReaperFixture f;
    const std::string media_id = "media_" + kFresh;

    // Media and transcript written two days ago; the session was touched
    // just now by a later highlight save.
    seed_session(f.memory, kFresh, f.clock.now - 48 * kHourMs);
    f.memory.put_durable(StoreKind::sessions,
                         EntityCodec::encode_session({kFresh, f.clock.now - 48 * kHourMs, f.clock.now}));
    f.memory.put_durable(StoreKind::highlights,
                         EntityCodec::encode_highlight_set(make_highlight("highlight_new", media_id, {"s2"}),
                                                           kFresh, f.clock.now));
    PersistenceRecord big = EntityCodec::encode_media(make_media("media_big", 64, false), kFresh,
                                                      f.clock.now - 48 * kHourMs,
                                                      StorageTierKind::metadata_only);
    f.memory.put_volatile(kVolatileMediaPrefix + big.id, EntityCodec::record_to_volatile(big));

    ReapSummary summary = f.reaper.reap();
    CHECK(summary.sessions_reaped == 0);
    CHECK(summary.records_reaped == 0);
    CHECK(records_of(f.memory, kFresh) == 5);
    CHECK(f.memory.get_durable(StoreKind::media, media_id));
    CHECK(f.memory.get_durable(StoreKind::transcripts, "transcript_" + kFresh));
    CHECK(f.memory.get_volatile(kVolatileMediaPrefix + std::string("media_big")));
}

TEST_CASE("Metadata-only media follows its session", "[reaper]") {
    ReaperFixture f;
    seed_session(f.memory, kOld, f.clock.now - 30 * kHourMs);
    seed_session(f.memory, kFresh, f.clock.now);

    auto put_volatile_media = [&](const std::string& id, const std::string& session_id) {
        PersistenceRecord r = EntityCodec::encode_media(make_media(id, 4, false), session_id, f.clock.now,
                                                        StorageTierKind::metadata_only);
        f.memory.put_volatile(kVolatileMediaPrefix + id, EntityCodec::record_to_volatile(r));
    };
    put_volatile_media("media_old_big", kOld);
    put_volatile_media("media_fresh_big", kFresh);
    put_volatile_media("media_orphan_big", "session_1600000000000_gonegoneg");
    f.memory.put_volatile("media/media_corrupt", "%%%");

    f.reaper.reap();

    CHECK(f.memory.volatile_keys(kVolatileMediaPrefix) == std::vector<std::string>{"media/media_fresh_big"});
}

TEST_CASE("One failing session does not block the others", "[reaper]") {
    ReaperFixture f;
    const std::string other = "session_1699000000001_otherothe";
    seed_session(f.memory, kOld, f.clock.now - 30 * kHourMs);
    seed_session(f.memory, other, f.clock.now - 30 * kHourMs);

    f.storage.fail_commits = 1;
    ReapSummary summary = f.reaper.reap();

    CHECK(summary.sessions_reaped == 1);
    CHECK(summary.failures == 1);
    // Exactly one of the two survived, intact.
    const std::size_t left = records_of(f.memory, kOld) + records_of(f.memory, other);
    CHECK(left == 4);

    f.reaper.reap();
    CHECK(records_of(f.memory, kOld) + records_of(f.memory, other) == 0);
}

TEST_CASE("Unavailable storage is reported, not thrown", "[reaper]") {
    ReaperFixture f;
    seed_session(f.memory, kOld, f.clock.now - 30 * kHourMs);
    f.storage.fail_reads = true;

    ReapSummary summary;
    REQUIRE_NOTHROW(summary = f.reaper.reap());
    CHECK(summary.failures == 1);
    CHECK(records_of(f.memory, kOld) == 4);
}
