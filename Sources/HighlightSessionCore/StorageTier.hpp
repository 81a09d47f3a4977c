#pragma once

#include "Types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hs {

/// Volatile key holding the scope's current session id.
constexpr const char* kSessionIdKey = "sessionId";

/// Volatile key holding the pending-termination directive.
constexpr const char* kClosingFlagKey = "isClosing";

/// Volatile key prefix for metadata-only Media records (`media/<id>`).
constexpr const char* kVolatileMediaPrefix = "media/";

/// A batch of deletions that either all happen or none do.
///
/// Operations are staged until commit().  Destroying an uncommitted
/// transaction discards everything staged on it.
class StorageTransaction {
public:
    virtual ~StorageTransaction() = default;

    virtual void remove(StoreKind store, const std::string& key) = 0;
    virtual void remove_by_session(StoreKind store, const std::string& session_id) = 0;
    virtual void remove_volatile(const std::string& key) = 0;

    /// Apply every staged operation and wait until the result is durable.
    /// Throws StorageUnavailable if the transaction rolled back.
    virtual void commit() = 0;
};

/// Host-supplied storage: a durable record store with four logical stores,
/// plus a volatile key/value store bounded by the host's scope.
///
/// Every call is synchronous.  Failures throw StorageUnavailable.
class StorageTier {
public:
    virtual ~StorageTier() = default;

    // ---- Durable tier ----

    /// Insert or replace by record id.
    virtual void put_durable(StoreKind store, const PersistenceRecord& record) = 0;
    virtual std::optional<PersistenceRecord> get_durable(StoreKind store,
                                                         const std::string& key) = 0;
    virtual std::vector<PersistenceRecord> get_all_durable(StoreKind store) = 0;
    virtual std::vector<PersistenceRecord> get_by_session(StoreKind store,
                                                          const std::string& session_id) = 0;
    virtual std::vector<PersistenceRecord> get_by_related(StoreKind store,
                                                          const std::string& related_id) = 0;
    virtual void delete_durable(StoreKind store, const std::string& key) = 0;

    /// Open a transaction covering `stores` (and the volatile tier).
    /// Staging an operation on a store not listed throws std::logic_error.
    virtual std::unique_ptr<StorageTransaction> begin_transaction(
        const std::vector<StoreKind>& stores) = 0;

    // ---- Volatile tier ----

    virtual void put_volatile(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> get_volatile(const std::string& key) = 0;
    virtual void remove_volatile(const std::string& key) = 0;

    /// Every volatile key starting with `prefix`, sorted.
    virtual std::vector<std::string> volatile_keys(const std::string& prefix) = 0;
};

} // namespace hs
