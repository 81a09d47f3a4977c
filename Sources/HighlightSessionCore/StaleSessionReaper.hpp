#pragma once

#include "SessionRegistry.hpp"
#include "StorageTier.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace hs {

/// 24 hours.
constexpr int64_t kDefaultStaleTtlMs = 24LL * 60 * 60 * 1000;

struct ReapSummary {
    std::size_t sessions_reaped = 0;
    std::size_t records_reaped  = 0;   // undecodable metadata-only records
    std::size_t failures        = 0;
};

/// Boot-time removal of data nobody will come back for.
///
/// A session is reaped when its `last_saved_at` is more than `ttl_ms` in
/// the past (the current session included), when its row cannot be
/// decoded, or when its id is malformed and not the current one.  Entity
/// records whose session no longer exists are removed as well.  Records of
/// a live session are left alone whatever their own `saved_at`.
///
/// Every session is deleted in its own transaction.  A failure is logged
/// and counted and the scan moves on.
class StaleSessionReaper {
public:
    StaleSessionReaper(StorageTier& storage, SessionContext context,
                       int64_t ttl_ms = kDefaultStaleTtlMs);

    // Non-copyable.
    StaleSessionReaper(const StaleSessionReaper&) = delete;
    StaleSessionReaper& operator=(const StaleSessionReaper&) = delete;

    ReapSummary reap();

    int64_t ttl_ms() const { return ttl_ms_; }

private:
    bool is_expired(int64_t saved_at, int64_t now) const { return now - saved_at > ttl_ms_; }

    /// Delete every record of `session_id` in one transaction.
    bool reap_session(const std::string& session_id);

    StorageTier&   storage_;
    SessionContext context_;
    int64_t        ttl_ms_;
};

} // namespace hs
