#include "SessionCleanupService.hpp"

#include "EntityCodec.hpp"
#include "Errors.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace hs {

SessionCleanupService::SessionCleanupService(StorageTier& storage, SessionContext context,
                                             std::vector<EntityCache*> caches)
    : storage_(storage), context_(context), caches_(std::move(caches)) {}

// ---------------------------------------------------------------------------
// execute
// ---------------------------------------------------------------------------

void SessionCleanupService::execute() {
    const std::string session_id = context_.session_id();
    if (session_id.empty()) {
        spdlog::warn("[SessionCleanup] no open session, clearing caches only");
        clear_caches();
        return;
    }

    try {
        // Resolve which metadata-only media belong to the session first; the
        // transaction itself only carries deletions.
        std::vector<std::string> volatile_media;
        for (const auto& key : storage_.volatile_keys(kVolatileMediaPrefix)) {
            auto value = storage_.get_volatile(key);
            if (!value) continue;
            try {
                if (EntityCodec::record_from_volatile(*value).session_id == session_id) {
                    volatile_media.push_back(key);
                }
            } catch (const DecodeFailure& e) {
                spdlog::warn("[SessionCleanup] leaving undecodable {} to the reaper: {}", key, e.what());
            }
        }

        auto txn = storage_.begin_transaction({StoreKind::media, StoreKind::transcripts,
                                               StoreKind::highlights, StoreKind::sessions});
        txn->remove_by_session(StoreKind::media, session_id);
        txn->remove_by_session(StoreKind::transcripts, session_id);
        txn->remove_by_session(StoreKind::highlights, session_id);
        txn->remove(StoreKind::sessions, session_id);
        for (const auto& key : volatile_media) {
            txn->remove_volatile(key);
        }
        txn->remove_volatile(kSessionIdKey);
        txn->remove_volatile(kClosingFlagKey);
        txn->commit();
    } catch (const StorageUnavailable& e) {
        clear_caches();
        spdlog::error("[SessionCleanup] cleanup of {} rolled back: {}", session_id, e.what());
        throw CleanupError("failed to clean up session " + session_id + ": " + e.what());
    }

    clear_caches();
    context_.registry().close();
    spdlog::info("[SessionCleanup] session {} deleted", session_id);
}

void SessionCleanupService::clear_caches() {
    for (EntityCache* cache : caches_) {
        cache->clear_cache();
    }
}

} // namespace hs
