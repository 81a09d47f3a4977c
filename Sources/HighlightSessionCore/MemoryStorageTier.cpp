#include "MemoryStorageTier.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace hs {

// ---------------------------------------------------------------------------
// StagedTransaction
// ---------------------------------------------------------------------------

class MemoryStorageTier::StagedTransaction : public StorageTransaction {
public:
    StagedTransaction(MemoryStorageTier& owner, std::vector<StoreKind> stores)
        : owner_(owner), stores_(std::move(stores)) {}

    void remove(StoreKind store, const std::string& key) override {
        check_scope(store);
        ops_.push_back({Op::Kind::by_key, store, key});
    }

    void remove_by_session(StoreKind store, const std::string& session_id) override {
        check_scope(store);
        ops_.push_back({Op::Kind::by_session, store, session_id});
    }

    void remove_volatile(const std::string& key) override {
        ops_.push_back({Op::Kind::scoped_value, StoreKind::sessions, key});
    }

    void commit() override {
        if (committed_) return;

        std::lock_guard<std::mutex> lock(owner_.mu_);
        for (const auto& op : ops_) {
            switch (op.kind) {
                case Op::Kind::by_key:
                    owner_.table(op.store).erase(op.value);
                    break;
                case Op::Kind::by_session: {
                    Table& t = owner_.table(op.store);
                    for (auto it = t.begin(); it != t.end();) {
                        it = it->second.session_id == op.value ? t.erase(it) : std::next(it);
                    }
                    break;
                }
                case Op::Kind::scoped_value:
                    owner_.volatile_.erase(op.value);
                    break;
            }
        }
        committed_ = true;
    }

private:
    struct Op {
        enum class Kind { by_key, by_session, scoped_value };
        Kind        kind;
        StoreKind   store;
        std::string value;
    };

    void check_scope(StoreKind store) const {
        if (std::find(stores_.begin(), stores_.end(), store) == stores_.end()) {
            throw std::logic_error(std::string("store '") + store_to_string(store) +
                                   "' is not part of this transaction");
        }
    }

    MemoryStorageTier&     owner_;
    std::vector<StoreKind> stores_;
    std::vector<Op>        ops_;
    bool                   committed_ = false;
};

// ---------------------------------------------------------------------------
// Durable tier
// ---------------------------------------------------------------------------

MemoryStorageTier::Table& MemoryStorageTier::table(StoreKind store) {
    return durable_[store];
}

template <typename Pred>
std::vector<PersistenceRecord> MemoryStorageTier::select(StoreKind store, Pred pred) {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<PersistenceRecord> out;
    for (const auto& entry : table(store)) {
        if (pred(entry.second)) out.push_back(entry.second);
    }
    // Same ordering as the SQLite tier: newest first.
    std::stable_sort(out.begin(), out.end(),
                     [](const PersistenceRecord& a, const PersistenceRecord& b) {
                         return a.saved_at > b.saved_at;
                     });
    return out;
}

void MemoryStorageTier::put_durable(StoreKind store, const PersistenceRecord& record) {
    std::lock_guard<std::mutex> lock(mu_);
    table(store)[record.id] = record;
}

std::optional<PersistenceRecord> MemoryStorageTier::get_durable(StoreKind store,
                                                                const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    const Table& t = table(store);
    auto it = t.find(key);
    if (it == t.end()) return std::nullopt;
    return it->second;
}

std::vector<PersistenceRecord> MemoryStorageTier::get_all_durable(StoreKind store) {
    return select(store, [](const PersistenceRecord&) { return true; });
}

std::vector<PersistenceRecord> MemoryStorageTier::get_by_session(StoreKind store,
                                                                 const std::string& session_id) {
    return select(store, [&](const PersistenceRecord& r) { return r.session_id == session_id; });
}

std::vector<PersistenceRecord> MemoryStorageTier::get_by_related(StoreKind store,
                                                                 const std::string& related_id) {
    return select(store, [&](const PersistenceRecord& r) { return r.related_id == related_id; });
}

void MemoryStorageTier::delete_durable(StoreKind store, const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    table(store).erase(key);
}

std::unique_ptr<StorageTransaction> MemoryStorageTier::begin_transaction(
    const std::vector<StoreKind>& stores) {
    return std::make_unique<StagedTransaction>(*this, stores);
}

// ---------------------------------------------------------------------------
// Volatile tier
// ---------------------------------------------------------------------------

void MemoryStorageTier::put_volatile(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mu_);
    volatile_[key] = value;
}

std::optional<std::string> MemoryStorageTier::get_volatile(const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = volatile_.find(key);
    if (it == volatile_.end()) return std::nullopt;
    return it->second;
}

void MemoryStorageTier::remove_volatile(const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    volatile_.erase(key);
}

std::vector<std::string> MemoryStorageTier::volatile_keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> keys;
    for (auto it = volatile_.lower_bound(prefix); it != volatile_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        keys.push_back(it->first);
    }
    return keys;
}

} // namespace hs
