#pragma once

#include "StorageTier.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward-declare sqlite3 so we don't leak its header into consumers.
struct sqlite3;

namespace hs {

/// SQLite-backed StorageTier.
///
/// One database file holds the four durable stores as tables plus a
/// `scoped_values` table for the volatile tier.  The volatile tier is keyed
/// by `scope`, so several independent hosts can share a file without seeing
/// each other's flags.
///
/// Uses SQLite WAL mode for crash-safe writes.  Every mutation runs in an
/// explicit transaction; a StorageTransaction commits all of its staged
/// deletions in a single one.
class SqliteStorageTier : public StorageTier {
public:
    /// Construct with an explicit database file path and volatile scope.
    SqliteStorageTier(const std::string& db_path, const std::string& scope);
    ~SqliteStorageTier() override;

    // Non-copyable.
    SqliteStorageTier(const SqliteStorageTier&) = delete;
    SqliteStorageTier& operator=(const SqliteStorageTier&) = delete;

    /// Open (or create) the database.  Returns false on failure.
    /// Automatically creates tables.
    bool open();

    /// Explicitly close the database.
    void close();

    /// Whether the database is open.
    bool is_open() const;

    const std::string& path() const { return db_path_; }
    const std::string& scope() const { return scope_; }

    // ---- StorageTier ----

    void put_durable(StoreKind store, const PersistenceRecord& record) override;
    std::optional<PersistenceRecord> get_durable(StoreKind store,
                                                 const std::string& key) override;
    std::vector<PersistenceRecord> get_all_durable(StoreKind store) override;
    std::vector<PersistenceRecord> get_by_session(StoreKind store,
                                                  const std::string& session_id) override;
    std::vector<PersistenceRecord> get_by_related(StoreKind store,
                                                  const std::string& related_id) override;
    void delete_durable(StoreKind store, const std::string& key) override;

    /// The returned transaction must not outlive this object.
    std::unique_ptr<StorageTransaction> begin_transaction(
        const std::vector<StoreKind>& stores) override;

    void put_volatile(const std::string& key, const std::string& value) override;
    std::optional<std::string> get_volatile(const std::string& key) override;
    void remove_volatile(const std::string& key) override;
    std::vector<std::string> volatile_keys(const std::string& prefix) override;

private:
    class BatchTransaction;

    /// CREATE TABLE IF NOT EXISTS ... for every store.
    bool create_tables();

    /// Throws StorageUnavailable if the database is not open.  Caller holds mu_.
    void require_open() const;

    std::vector<PersistenceRecord> select_records(StoreKind store,
                                                  const char* where_column,
                                                  const std::string& value);

    std::string        db_path_;
    std::string        scope_;
    sqlite3*           db_ = nullptr;
    mutable std::mutex mu_;
};

} // namespace hs
