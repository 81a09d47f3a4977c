#pragma once

#include "StorageTier.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hs {

/// StorageTier held entirely in process memory.
///
/// Used when the database cannot be opened: every contract holds for the
/// lifetime of the process, nothing survives it.  Transactions stage their
/// operations and apply them in one step at commit.
class MemoryStorageTier : public StorageTier {
public:
    MemoryStorageTier() = default;

    // Non-copyable.
    MemoryStorageTier(const MemoryStorageTier&) = delete;
    MemoryStorageTier& operator=(const MemoryStorageTier&) = delete;

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
    class StagedTransaction;

    using Table = std::map<std::string, PersistenceRecord>;

    Table& table(StoreKind store);

    template <typename Pred>
    std::vector<PersistenceRecord> select(StoreKind store, Pred pred);

    std::map<StoreKind, Table>         durable_;
    std::map<std::string, std::string> volatile_;
    std::mutex                         mu_;
};

} // namespace hs
