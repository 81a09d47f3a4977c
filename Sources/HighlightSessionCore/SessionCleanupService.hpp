#pragma once

#include "EntityStore.hpp"
#include "SessionRegistry.hpp"
#include "StorageTier.hpp"

#include <vector>

namespace hs {

/// Deletes everything the current session left at rest, all or nothing.
///
/// Entity records of every store, metadata-only media, the SessionRecord
/// and the scope's `sessionId` and `isClosing` keys go in one
/// StorageTransaction.  On commit the registry is closed; the next open()
/// begins a new session.
class SessionCleanupService {
public:
    SessionCleanupService(StorageTier& storage, SessionContext context,
                          std::vector<EntityCache*> caches);

    // Non-copyable.
    SessionCleanupService(const SessionCleanupService&) = delete;
    SessionCleanupService& operator=(const SessionCleanupService&) = delete;

    /// Throws CleanupError if the transaction did not commit, in which case
    /// nothing was deleted.  Every cache is cleared either way.
    void execute();

private:
    void clear_caches();

    StorageTier&              storage_;
    SessionContext            context_;
    std::vector<EntityCache*> caches_;
};

} // namespace hs
