#include "StaleSessionReaper.hpp"

#include "EntityCodec.hpp"
#include "Errors.hpp"
#include "Identifiers.hpp"

#include <set>
#include <vector>

#include <spdlog/spdlog.h>

namespace hs {

namespace {

const std::vector<StoreKind> kEntityStores = {
    StoreKind::media, StoreKind::transcripts, StoreKind::highlights};

const std::vector<StoreKind> kAllStores = {
    StoreKind::media, StoreKind::transcripts, StoreKind::highlights, StoreKind::sessions};

} // namespace

StaleSessionReaper::StaleSessionReaper(StorageTier& storage, SessionContext context,
                                       int64_t ttl_ms)
    : storage_(storage), context_(context), ttl_ms_(ttl_ms) {}

// ---------------------------------------------------------------------------
// reap
// ---------------------------------------------------------------------------

ReapSummary StaleSessionReaper::reap() {
    ReapSummary summary;
    const int64_t now = context_.registry().now();
    const std::string current = context_.session_id();

    std::vector<PersistenceRecord> session_rows;
    try {
        session_rows = storage_.get_all_durable(StoreKind::sessions);
    } catch (const StorageUnavailable& e) {
        spdlog::warn("[StaleSessionReaper] cannot list sessions: {}", e.what());
        ++summary.failures;
        return summary;
    }

    // Sessions still at rest once this pass is over.  A session whose
    // deletion failed stays here until the next boot.
    std::set<std::string> live;

    // ---- Session records ----

    for (const auto& row : session_rows) {
        const char* reason = nullptr;
        try {
            SessionRecord record = EntityCodec::decode_session(row);
            if (is_expired(record.last_saved_at, now)) {
                reason = "expired";
            } else if (record.session_id != current && !is_valid_session_id(record.session_id)) {
                reason = "malformed id";
            }
        } catch (const DecodeFailure& e) {
            spdlog::warn("[StaleSessionReaper] undecodable session row {}: {}", row.id, e.what());
            reason = "undecodable";
        }

        if (!reason) {
            live.insert(row.id);
            continue;
        }

        spdlog::info("[StaleSessionReaper] reaping session {} ({})", row.id, reason);
        if (reap_session(row.id)) {
            ++summary.sessions_reaped;
            if (row.id == current) context_.registry().discard_record();
        } else {
            ++summary.failures;
            live.insert(row.id);
        }
    }

    // ---- Entity records ----

    // Only whole sessions expire; a live session keeps every record.
    std::set<std::string> orphaned;
    auto is_orphan = [&](const std::string& session_id) {
        return session_id != current && live.count(session_id) == 0;
    };

    for (StoreKind store : kEntityStores) {
        std::vector<PersistenceRecord> rows;
        try {
            rows = storage_.get_all_durable(store);
        } catch (const StorageUnavailable& e) {
            spdlog::warn("[StaleSessionReaper] cannot scan {}: {}", store_to_string(store), e.what());
            ++summary.failures;
            continue;
        }

        for (const auto& row : rows) {
            if (is_orphan(row.session_id)) orphaned.insert(row.session_id);
        }
    }

    // ---- Metadata-only media ----

    try {
        for (const auto& key : storage_.volatile_keys(kVolatileMediaPrefix)) {
            auto value = storage_.get_volatile(key);
            if (!value) continue;

            try {
                PersistenceRecord row = EntityCodec::record_from_volatile(*value);
                if (is_orphan(row.session_id)) orphaned.insert(row.session_id);
            } catch (const DecodeFailure& e) {
                spdlog::warn("[StaleSessionReaper] undecodable volatile record {}: {}", key, e.what());
                storage_.remove_volatile(key);
                ++summary.records_reaped;
            }
        }
    } catch (const StorageUnavailable& e) {
        spdlog::warn("[StaleSessionReaper] cannot scan volatile media: {}", e.what());
        ++summary.failures;
    }

    for (const auto& session_id : orphaned) {
        spdlog::info("[StaleSessionReaper] reaping orphaned records of {}", session_id);
        if (reap_session(session_id)) {
            ++summary.sessions_reaped;
        } else {
            ++summary.failures;
        }
    }

    if (summary.sessions_reaped > 0 || summary.records_reaped > 0) {
        spdlog::info("[StaleSessionReaper] reaped {} session(s), {} record(s), {} failure(s)",
                     summary.sessions_reaped, summary.records_reaped, summary.failures);
    }
    return summary;
}

// ---------------------------------------------------------------------------
// reap_session
// ---------------------------------------------------------------------------

bool StaleSessionReaper::reap_session(const std::string& session_id) {
    try {
        // Metadata-only media of this session, found before the transaction opens.
        std::vector<std::string> volatile_media;
        for (const auto& key : storage_.volatile_keys(kVolatileMediaPrefix)) {
            auto value = storage_.get_volatile(key);
            if (!value) continue;
            try {
                if (EntityCodec::record_from_volatile(*value).session_id == session_id) {
                    volatile_media.push_back(key);
                }
            } catch (const DecodeFailure&) {
                // Removed by the volatile scan in reap().
                continue;
            }
        }

        auto txn = storage_.begin_transaction(kAllStores);
        for (StoreKind store : kEntityStores) {
            txn->remove_by_session(store, session_id);
        }
        txn->remove(StoreKind::sessions, session_id);
        for (const auto& key : volatile_media) {
            txn->remove_volatile(key);
        }
        txn->commit();
        return true;
    } catch (const StorageUnavailable& e) {
        spdlog::warn("[StaleSessionReaper] failed to reap {}: {}", session_id, e.what());
        return false;
    }
}

} // namespace hs
