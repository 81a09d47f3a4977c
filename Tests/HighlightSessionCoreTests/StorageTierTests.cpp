#include "Errors.hpp"
#include "MemoryStorageTier.hpp"
#include "SqliteStorageTier.hpp"
#include "TestSupport.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <stdexcept>

using namespace hs;
using namespace hs::test;

namespace {

struct MemoryTier {
    MemoryStorageTier tier;
};

struct SqliteTier {
    TempDatabase      db;
    SqliteStorageTier tier{db.path(), "test"};

    SqliteTier() { REQUIRE(tier.open()); }
};

PersistenceRecord record(const std::string& id, const std::string& session_id,
                         const std::string& related_id, int64_t saved_at) {
    PersistenceRecord r;
    r.id = id;
    r.session_id = session_id;
    r.related_id = related_id;
    r.saved_at = saved_at;
    r.payload = "{}";
    return r;
}

} // namespace

// ---------------------------------------------------------------------------
// Contract shared by every tier
// ---------------------------------------------------------------------------

TEMPLATE_TEST_CASE("StorageTier durable records", "[storage]", MemoryTier, SqliteTier) {
    TestType fixture;
    StorageTier& tier = fixture.tier;

    tier.put_durable(StoreKind::transcripts, record("t1", "sA", "m1", 100));
    tier.put_durable(StoreKind::transcripts, record("t2", "sA", "m2", 300));
    tier.put_durable(StoreKind::transcripts, record("t3", "sB", "m1", 200));

    SECTION("get by key") {
        auto t1 = tier.get_durable(StoreKind::transcripts, "t1");
        REQUIRE(t1);
        CHECK(t1->session_id == "sA");
        CHECK(t1->related_id == "m1");
        CHECK(t1->saved_at == 100);
        CHECK_FALSE(tier.get_durable(StoreKind::transcripts, "nope"));
        CHECK_FALSE(tier.get_durable(StoreKind::media, "t1"));
    }

    SECTION("put replaces by id") {
        tier.put_durable(StoreKind::transcripts, record("t1", "sA", "m9", 400));
        CHECK(tier.get_durable(StoreKind::transcripts, "t1")->related_id == "m9");
        CHECK(tier.get_all_durable(StoreKind::transcripts).size() == 3);
    }

    SECTION("secondary lookups are newest first") {
        auto all = tier.get_all_durable(StoreKind::transcripts);
        REQUIRE(all.size() == 3);
        CHECK(all[0].id == "t2");
        CHECK(all[1].id == "t3");
        CHECK(all[2].id == "t1");

        auto by_session = tier.get_by_session(StoreKind::transcripts, "sA");
        REQUIRE(by_session.size() == 2);
        CHECK(by_session[0].id == "t2");

        auto by_related = tier.get_by_related(StoreKind::transcripts, "m1");
        REQUIRE(by_related.size() == 2);
        CHECK(by_related[0].id == "t3");
    }

    SECTION("blobs survive") {
        PersistenceRecord m = record("m1", "sA", "sA", 100);
        m.blob = {1, 2, 3, 0, 255};
        tier.put_durable(StoreKind::media, m);
        CHECK(tier.get_durable(StoreKind::media, "m1")->blob == m.blob);
    }

    SECTION("delete") {
        tier.delete_durable(StoreKind::transcripts, "t1");
        tier.delete_durable(StoreKind::transcripts, "never-there");
        CHECK_FALSE(tier.get_durable(StoreKind::transcripts, "t1"));
        CHECK(tier.get_all_durable(StoreKind::transcripts).size() == 2);
    }
}

TEMPLATE_TEST_CASE("StorageTier volatile values", "[storage]", MemoryTier, SqliteTier) {
    TestType fixture;
    StorageTier& tier = fixture.tier;

    tier.put_volatile("media/b", "2");
    tier.put_volatile("media/a", "1");
    tier.put_volatile("sessionId", "s");

    CHECK(tier.get_volatile("media/a") == std::optional<std::string>("1"));
    CHECK_FALSE(tier.get_volatile("media/c"));
    CHECK(tier.volatile_keys("media/") == std::vector<std::string>{"media/a", "media/b"});
    CHECK(tier.volatile_keys("nothing/").empty());

    tier.put_volatile("media/a", "1b");
    CHECK(tier.get_volatile("media/a") == std::optional<std::string>("1b"));

    tier.remove_volatile("media/a");
    CHECK_FALSE(tier.get_volatile("media/a"));
    CHECK(tier.volatile_keys("media/").size() == 1);
}

TEMPLATE_TEST_CASE("StorageTier transactions", "[storage]", MemoryTier, SqliteTier) {
    TestType fixture;
    StorageTier& tier = fixture.tier;

    tier.put_durable(StoreKind::media, record("m1", "sA", "sA", 100));
    tier.put_durable(StoreKind::highlights, record("h1", "sA", "m1", 100));
    tier.put_durable(StoreKind::highlights, record("h2", "sA", "m1", 100));
    tier.put_durable(StoreKind::highlights, record("h3", "sB", "m7", 100));
    tier.put_volatile("isClosing", "{}");

    SECTION("commit applies every staged operation") {
        auto txn = tier.begin_transaction({StoreKind::media, StoreKind::highlights});
        txn->remove(StoreKind::media, "m1");
        txn->remove_by_session(StoreKind::highlights, "sA");
        txn->remove_volatile("isClosing");

        // Staged only.
        CHECK(tier.get_durable(StoreKind::media, "m1"));

        txn->commit();
        CHECK_FALSE(tier.get_durable(StoreKind::media, "m1"));
        CHECK(tier.get_by_session(StoreKind::highlights, "sA").empty());
        CHECK(tier.get_durable(StoreKind::highlights, "h3"));
        CHECK_FALSE(tier.get_volatile("isClosing"));
    }

    SECTION("an abandoned transaction changes nothing") {
        {
            auto txn = tier.begin_transaction({StoreKind::media});
            txn->remove(StoreKind::media, "m1");
            txn->remove_volatile("isClosing");
        }
        CHECK(tier.get_durable(StoreKind::media, "m1"));
        CHECK(tier.get_volatile("isClosing"));
    }

    SECTION("stores outside the transaction are rejected") {
        auto txn = tier.begin_transaction({StoreKind::media});
        REQUIRE_THROWS_AS(txn->remove_by_session(StoreKind::highlights, "sA"), std::logic_error);
    }
}

// ---------------------------------------------------------------------------
// SQLite specifics
// ---------------------------------------------------------------------------

TEST_CASE("SQLite records survive reopening", "[storage][sqlite]") {
    TempDatabase db;
    {
        SqliteStorageTier tier(db.path(), "tab");
        REQUIRE(tier.open());
        tier.put_durable(StoreKind::sessions, record("sA", "sA", "", 100));
        tier.put_volatile("isClosing", "{\"isClosing\":true}");
    }

    SqliteStorageTier tier(db.path(), "tab");
    REQUIRE(tier.open());
    CHECK(tier.get_durable(StoreKind::sessions, "sA"));
    CHECK(tier.get_volatile("isClosing"));
}

TEST_CASE("SQLite volatile values are bounded by scope", "[storage][sqlite]") {
    TempDatabase db;
    SqliteStorageTier first(db.path(), "tab-1");
    SqliteStorageTier second(db.path(), "tab-2");
    REQUIRE(first.open());
    REQUIRE(second.open());

    first.put_volatile("sessionId", "one");
    second.put_volatile("sessionId", "two");
    CHECK(first.get_volatile("sessionId") == std::optional<std::string>("one"));
    CHECK(second.get_volatile("sessionId") == std::optional<std::string>("two"));

    // Durable records are shared.
    first.put_durable(StoreKind::media, record("m1", "sA", "sA", 1));
    CHECK(second.get_durable(StoreKind::media, "m1"));
}

TEST_CASE("SQLite tier that is not open is unavailable", "[storage][sqlite]") {
    SqliteStorageTier closed((std::filesystem::temp_directory_path() / "hs-never-opened.db").string(),
                             "tab");
    CHECK_FALSE(closed.is_open());
    REQUIRE_THROWS_AS(closed.put_durable(StoreKind::media, record("m1", "sA", "sA", 1)),
                      StorageUnavailable);
    REQUIRE_THROWS_AS(closed.get_volatile("sessionId"), StorageUnavailable);
    REQUIRE_THROWS_AS(closed.begin_transaction({StoreKind::media}), StorageUnavailable);

    // A directory cannot be opened as a database.
    SqliteStorageTier directory(std::filesystem::temp_directory_path().string(), "tab");
    CHECK_FALSE(directory.open());
}
