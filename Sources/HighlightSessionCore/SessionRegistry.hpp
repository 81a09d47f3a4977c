#pragma once

#include "Identifiers.hpp"
#include "StorageTier.hpp"
#include "Types.hpp"

#include <optional>
#include <string>

namespace hs {

/// Owns the current session identifier and its SessionRecord.
///
/// The id lives in the volatile tier under `sessionId`, so a restart in
/// place keeps it and a cleanup removes it.  The SessionRecord is created
/// lazily by the first entity write and lives in the durable `sessions`
/// store.
class SessionRegistry {
public:
    explicit SessionRegistry(StorageTier& storage, Clock clock = now_unix_ms);

    // Non-copyable.
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /// Adopt the scope's stored session id, or generate and store a new one.
    /// Storage failures are logged; the id is still valid for this process.
    const std::string& open();

    /// Forget the current session (after its data was deleted).
    void close();

    bool is_open() const { return !session_id_.empty(); }

    /// Empty while closed.
    const std::string& session_id() const { return session_id_; }

    /// The current session's record, if one has been written or loaded.
    const std::optional<SessionRecord>& current() const { return record_; }

    /// Record an entity write: creates the SessionRecord on first use and
    /// bumps `last_saved_at`.  The in-memory record is updated before the
    /// storage write, which throws StorageUnavailable on failure.
    void touch();

    /// Drop the cached record without touching storage.
    void discard_record() { record_.reset(); }

    int64_t now() const { return clock_(); }

private:
    StorageTier&                 storage_;
    Clock                        clock_;
    std::string                  session_id_;
    std::optional<SessionRecord> record_;
};

/// Non-owning view of the session every component works on.
///
/// Handed to each component constructor instead of a global; `session_id()`
/// always answers for the registry's current session.
class SessionContext {
public:
    explicit SessionContext(SessionRegistry& registry) : registry_(&registry) {}

    const std::string& session_id() const { return registry_->session_id(); }
    SessionRegistry& registry() const { return *registry_; }

private:
    SessionRegistry* registry_;
};

} // namespace hs
