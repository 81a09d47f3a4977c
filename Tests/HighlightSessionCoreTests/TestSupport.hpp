#pragma once

#include "Errors.hpp"
#include "HostRuntime.hpp"
#include "StorageTier.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hs {
namespace test {

/// 2023-11-14T22:13:20Z
constexpr int64_t kEpochMs = 1700000000000;
constexpr int64_t kHourMs  = 60LL * 60 * 1000;

// ---------------------------------------------------------------------------
// Clock
// ---------------------------------------------------------------------------

/// Manually advanced clock.  Must outlive every component it is handed to.
struct FakeClock {
    int64_t now = kEpochMs;

    Clock as_clock() {
        return [this] { return now; };
    }
    void advance(int64_t ms) { now += ms; }
};

// ---------------------------------------------------------------------------
// Fault injection
// ---------------------------------------------------------------------------

/// Forwards to another StorageTier and throws StorageUnavailable on demand.
class FaultyStorageTier : public StorageTier {
public:
    explicit FaultyStorageTier(StorageTier& inner) : inner_(inner) {}

    bool fail_reads   = false;
    bool fail_writes  = false;
    int  fail_commits = 0;   // number of upcoming commits to reject

    void put_durable(StoreKind store, const PersistenceRecord& record) override {
        write_gate("put_durable");
        inner_.put_durable(store, record);
    }
    std::optional<PersistenceRecord> get_durable(StoreKind store, const std::string& key) override {
        read_gate("get_durable");
        return inner_.get_durable(store, key);
    }
    std::vector<PersistenceRecord> get_all_durable(StoreKind store) override {
        read_gate("get_all_durable");
        return inner_.get_all_durable(store);
    }
    std::vector<PersistenceRecord> get_by_session(StoreKind store,
                                                  const std::string& session_id) override {
        read_gate("get_by_session");
        return inner_.get_by_session(store, session_id);
    }
    std::vector<PersistenceRecord> get_by_related(StoreKind store,
                                                  const std::string& related_id) override {
        read_gate("get_by_related");
        return inner_.get_by_related(store, related_id);
    }
    void delete_durable(StoreKind store, const std::string& key) override {
        write_gate("delete_durable");
        inner_.delete_durable(store, key);
    }

    std::unique_ptr<StorageTransaction> begin_transaction(
        const std::vector<StoreKind>& stores) override {
        return std::make_unique<FaultyTransaction>(*this, inner_.begin_transaction(stores));
    }

    void put_volatile(const std::string& key, const std::string& value) override {
        write_gate("put_volatile");
        inner_.put_volatile(key, value);
    }
    std::optional<std::string> get_volatile(const std::string& key) override {
        read_gate("get_volatile");
        return inner_.get_volatile(key);
    }
    void remove_volatile(const std::string& key) override {
        write_gate("remove_volatile");
        inner_.remove_volatile(key);
    }
    std::vector<std::string> volatile_keys(const std::string& prefix) override {
        read_gate("volatile_keys");
        return inner_.volatile_keys(prefix);
    }

private:
    class FaultyTransaction : public StorageTransaction {
    public:
        FaultyTransaction(FaultyStorageTier& owner, std::unique_ptr<StorageTransaction> inner)
            : owner_(owner), inner_(std::move(inner)) {}

        void remove(StoreKind store, const std::string& key) override {
            inner_->remove(store, key);
        }
        void remove_by_session(StoreKind store, const std::string& session_id) override {
            inner_->remove_by_session(store, session_id);
        }
        void remove_volatile(const std::string& key) override {
            inner_->remove_volatile(key);
        }
        void commit() override {
            if (owner_.fail_commits > 0) {
                --owner_.fail_commits;
                throw StorageUnavailable("injected commit failure");
            }
            inner_->commit();
        }

    private:
        FaultyStorageTier&                  owner_;
        std::unique_ptr<StorageTransaction> inner_;
    };

    void read_gate(const char* op) const {
        if (fail_reads) throw StorageUnavailable(std::string("injected read failure: ") + op);
    }
    void write_gate(const char* op) const {
        if (fail_writes) throw StorageUnavailable(std::string("injected write failure: ") + op);
    }

    StorageTier& inner_;
};

// ---------------------------------------------------------------------------
// Host
// ---------------------------------------------------------------------------

class FakeHost : public HostRuntime {
public:
    void on_about_to_terminate(Handler handler) override { about_to_terminate_ = std::move(handler); }
    void on_restarted(Handler handler) override { restarted_ = std::move(handler); }
    void on_cold_start(Handler handler) override { cold_start_ = std::move(handler); }

    void fire_about_to_terminate() { if (about_to_terminate_) about_to_terminate_(); }
    void fire_restarted() { if (restarted_) restarted_(); }
    void fire_cold_start() { if (cold_start_) cold_start_(); }

private:
    Handler about_to_terminate_;
    Handler restarted_;
    Handler cold_start_;
};

/// Hands out "blob:<n>" handles, or throws when told to.
class FakeMediaProvider : public MediaReferenceProvider {
public:
    bool fail  = false;
    int  calls = 0;

    std::string materialize(const MediaBytes& bytes) override {
        ++calls;
        if (fail) throw std::runtime_error("provider unavailable");
        return "blob:" + std::to_string(bytes ? bytes->size() : 0);
    }
};

// ---------------------------------------------------------------------------
// Temporary database
// ---------------------------------------------------------------------------

/// Unique database path under the system temp directory, removed (with its
/// WAL side files) on destruction.
class TempDatabase {
public:
    TempDatabase() {
        static std::atomic<int> counter{0};
        const std::string name = "hs-test-" + std::to_string(ticks()) + "-" +
                                 std::to_string(counter++) + ".db";
        path_ = std::filesystem::temp_directory_path() / name;
    }
    ~TempDatabase() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
            std::filesystem::remove(path_.string() + suffix, ec);
        }
    }

    TempDatabase(const TempDatabase&) = delete;
    TempDatabase& operator=(const TempDatabase&) = delete;

    std::string path() const { return path_.string(); }

private:
    static int64_t ticks() {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                        std::chrono::steady_clock::now().time_since_epoch())
                                        .count());
    }

    std::filesystem::path path_;
};

// ---------------------------------------------------------------------------
// Sample entities
// ---------------------------------------------------------------------------

inline Media make_media(const std::string& id, std::size_t payload_bytes, bool with_bytes = true) {
    Media media;
    media.id = id;
    media.metadata.duration_seconds = 12.5;
    media.metadata.width = 1920;
    media.metadata.height = 1080;
    media.metadata.size_bytes = payload_bytes;
    media.metadata.mime_type = "video/mp4";
    media.metadata.name = id + ".mp4";
    if (with_bytes) {
        media.bytes = std::make_shared<const std::vector<uint8_t>>(payload_bytes, uint8_t{0x2a});
    }
    return media;
}

inline Sentence make_sentence(const std::string& id, int64_t start_ms, int64_t end_ms,
                              bool suggested = false) {
    return Sentence{id, "text of " + id, TimeRange::make(start_ms, end_ms), suggested};
}

/// Two sections, four sentences: s1 [0,1000] s2 [1000,2500] | s3 [3000,4000] s4 [4000,6000].
inline Transcript make_transcript(const std::string& id, const std::string& media_id) {
    Transcript t;
    t.id = id;
    t.media_id = media_id;
    t.full_text = "text of s1 text of s2 text of s3 text of s4";
    t.sections.push_back(Section{"sec1", "Opening",
                                 {make_sentence("s1", 0, 1000, true),
                                  make_sentence("s2", 1000, 2500)}});
    t.sections.push_back(Section{"sec2", "Closing",
                                 {make_sentence("s3", 3000, 4000),
                                  make_sentence("s4", 4000, 6000, true)}});
    return t;
}

inline HighlightSet make_highlight(const std::string& id, const std::string& media_id,
                                   std::vector<std::string> sentence_ids) {
    HighlightSet h;
    h.id = id;
    h.media_id = media_id;
    h.name = "Highlight " + id;
    h.selected_sentence_ids = std::move(sentence_ids);
    return h;
}

} // namespace test
} // namespace hs
