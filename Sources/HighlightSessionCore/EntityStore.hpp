#pragma once

#include "EntityCodec.hpp"
#include "EntityTraits.hpp"
#include "Errors.hpp"
#include "SessionRegistry.hpp"
#include "StorageTier.hpp"
#include "TieringPolicy.hpp"
#include "Types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace hs {

/// Type-erased handle on an EntityStore's cache, used by cleanup.
class EntityCache {
public:
    virtual ~EntityCache() = default;
    virtual void clear_cache() = 0;
    virtual std::size_t cached_count() const = 0;
};

/// Write-through repository for one entity kind.
///
/// The in-memory map is the source of truth for the rest of the process:
/// save() always lands in memory first, and storage failures are logged,
/// never propagated.  Reads hit memory first and fall back to the
/// StorageTier, caching what they decode.  Records that fail to decode are
/// logged and treated as absent.
///
/// Relation and bulk lookups only return entities of the context's current
/// session.
template <typename Entity>
class EntityStore : public EntityCache {
public:
    using Traits = EntityTraits<Entity>;

    EntityStore(StorageTier& storage, SessionContext context,
                TieringPolicy policy = TieringPolicy())
        : storage_(storage), context_(context), policy_(policy) {}

    // Non-copyable.
    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    void save(const Entity& entity) {
        const std::string& session_id = context_.session_id();
        const int64_t now = context_.registry().now();
        const StorageTierKind tier = Traits::tier(entity, policy_);
        const std::string& id = Traits::id(entity);

        PersistenceRecord record = Traits::encode(entity, session_id, now, tier);
        cache_[id] = Entry{entity, session_id, record.related_id, now};

        try {
            context_.registry().touch();
            if (tier == StorageTierKind::full) {
                storage_.put_durable(Traits::kStore, record);
                if constexpr (Traits::kHasVolatileTier) {
                    storage_.remove_volatile(volatile_key(id));
                }
            } else {
                storage_.put_volatile(volatile_key(id), EntityCodec::record_to_volatile(record));
                storage_.delete_durable(Traits::kStore, id);
            }
        } catch (const StorageUnavailable& e) {
            spdlog::warn("[EntityStore<{}>] {} kept in memory only: {}", Traits::kName, id, e.what());
        }
    }

    std::optional<Entity> find_by_id(const std::string& id) {
        auto it = cache_.find(id);
        if (it != cache_.end()) {
            spdlog::debug("[EntityStore<{}>] cache hit {}", Traits::kName, id);
            return it->second.entity;
        }

        std::optional<PersistenceRecord> row;
        try {
            row = storage_.get_durable(Traits::kStore, id);
            if constexpr (Traits::kHasVolatileTier) {
                if (!row) {
                    if (auto value = storage_.get_volatile(volatile_key(id))) {
                        row = EntityCodec::record_from_volatile(*value);
                    }
                }
            }
        } catch (const SessionError& e) {
            spdlog::warn("[EntityStore<{}>] lookup of {} failed: {}", Traits::kName, id, e.what());
            return std::nullopt;
        }
        if (!row) return std::nullopt;

        auto entry = decode(*row);
        if (!entry) return std::nullopt;
        Entity entity = entry->entity;
        cache_[id] = std::move(*entry);
        return entity;
    }

    /// Newest first.
    std::vector<Entity> find_by_related_id(const std::string& related_id) {
        const std::string& session_id = context_.session_id();

        std::vector<const Entry*> hits;
        for (const auto& kv : cache_) {
            if (kv.second.related_id == related_id && kv.second.session_id == session_id) {
                hits.push_back(&kv.second);
            }
        }
        if (!hits.empty()) return sorted(hits);

        std::vector<PersistenceRecord> rows;
        try {
            rows = storage_.get_by_related(Traits::kStore, related_id);
            if constexpr (Traits::kHasVolatileTier) {
                append_volatile_rows(rows);
            }
        } catch (const StorageUnavailable& e) {
            spdlog::warn("[EntityStore<{}>] related lookup of {} failed: {}",
                         Traits::kName, related_id, e.what());
            return {};
        }

        for (const auto& row : rows) {
            if (row.session_id != session_id || row.related_id != related_id) continue;
            if (auto entry = decode(row)) {
                cache_[Traits::id(entry->entity)] = std::move(*entry);
            }
        }

        // Collected from the map so an id stored in both tiers counts once.
        for (const auto& kv : cache_) {
            if (kv.second.related_id == related_id && kv.second.session_id == session_id) {
                hits.push_back(&kv.second);
            }
        }
        return sorted(hits);
    }

    /// Newest first.  Once memory holds anything it is returned as-is; the
    /// bulk storage scan runs only while the cache is empty.
    std::vector<Entity> find_all() {
        const std::string& session_id = context_.session_id();

        if (cache_.empty()) {
            std::vector<PersistenceRecord> rows;
            try {
                rows = storage_.get_by_session(Traits::kStore, session_id);
                if constexpr (Traits::kHasVolatileTier) {
                    append_volatile_rows(rows);
                }
            } catch (const StorageUnavailable& e) {
                spdlog::warn("[EntityStore<{}>] bulk load failed: {}", Traits::kName, e.what());
                return {};
            }

            for (const auto& row : rows) {
                if (row.session_id != session_id) continue;
                if (auto entry = decode(row)) {
                    cache_[Traits::id(entry->entity)] = std::move(*entry);
                }
            }
            spdlog::debug("[EntityStore<{}>] loaded {} record(s) for {}",
                          Traits::kName, cache_.size(), session_id);
        }

        std::vector<const Entry*> hits;
        for (const auto& kv : cache_) {
            if (kv.second.session_id == session_id) hits.push_back(&kv.second);
        }
        return sorted(hits);
    }

    void clear_cache() override { cache_.clear(); }

    std::size_t cached_count() const override { return cache_.size(); }

private:
    struct Entry {
        Entity      entity;
        std::string session_id;
        std::string related_id;
        int64_t     saved_at = 0;
    };

    static std::string volatile_key(const std::string& id) {
        return kVolatileMediaPrefix + id;
    }

    std::optional<Entry> decode(const PersistenceRecord& row) const {
        try {
            return Entry{Traits::decode(row), row.session_id, row.related_id, row.saved_at};
        } catch (const DecodeFailure& e) {
            spdlog::warn("[EntityStore<{}>] treating {} as absent: {}", Traits::kName, row.id, e.what());
            return std::nullopt;
        }
    }

    /// Metadata-only records; undecodable values are logged and skipped.
    void append_volatile_rows(std::vector<PersistenceRecord>& rows) {
        for (const auto& key : storage_.volatile_keys(kVolatileMediaPrefix)) {
            auto value = storage_.get_volatile(key);
            if (!value) continue;
            try {
                rows.push_back(EntityCodec::record_from_volatile(*value));
            } catch (const DecodeFailure& e) {
                spdlog::warn("[EntityStore<{}>] skipping {}: {}", Traits::kName, key, e.what());
            }
        }
    }

    static std::vector<Entity> sorted(std::vector<const Entry*> entries) {
        std::sort(entries.begin(), entries.end(), [](const Entry* a, const Entry* b) {
            if (a->saved_at != b->saved_at) return a->saved_at > b->saved_at;
            return Traits::id(a->entity) < Traits::id(b->entity);
        });
        std::vector<Entity> out;
        out.reserve(entries.size());
        for (const Entry* e : entries) out.push_back(e->entity);
        return out;
    }

    StorageTier&                           storage_;
    SessionContext                         context_;
    TieringPolicy                          policy_;
    std::unordered_map<std::string, Entry> cache_;
};

using MediaStore        = EntityStore<Media>;
using TranscriptStore   = EntityStore<Transcript>;
using HighlightSetStore = EntityStore<HighlightSet>;

} // namespace hs
