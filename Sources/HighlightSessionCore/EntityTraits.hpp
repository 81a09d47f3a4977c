#pragma once

#include "EntityCodec.hpp"
#include "TieringPolicy.hpp"
#include "Types.hpp"

#include <string>

namespace hs {

/// Per-entity glue used by EntityStore: where the entity lives, how it is
/// keyed and how it is encoded.
template <typename Entity>
struct EntityTraits;

template <>
struct EntityTraits<Media> {
    static constexpr const char* kName            = "Media";
    static constexpr StoreKind   kStore           = StoreKind::media;
    static constexpr bool        kHasVolatileTier = true;

    static const std::string& id(const Media& m) { return m.id; }

    /// Media without a payload has nothing to keep in the durable tier.
    static StorageTierKind tier(const Media& m, const TieringPolicy& policy) {
        if (!m.bytes) return StorageTierKind::metadata_only;
        return policy.choose_tier(m.bytes->size());
    }

    static PersistenceRecord encode(const Media& m, const std::string& session_id,
                                    int64_t saved_at, StorageTierKind tier) {
        return EntityCodec::encode_media(m, session_id, saved_at, tier);
    }

    static Media decode(const PersistenceRecord& r) { return EntityCodec::decode_media(r); }
};

template <>
struct EntityTraits<Transcript> {
    static constexpr const char* kName            = "Transcript";
    static constexpr StoreKind   kStore           = StoreKind::transcripts;
    static constexpr bool        kHasVolatileTier = false;

    static const std::string& id(const Transcript& t) { return t.id; }

    static StorageTierKind tier(const Transcript&, const TieringPolicy&) {
        return StorageTierKind::full;
    }

    static PersistenceRecord encode(const Transcript& t, const std::string& session_id,
                                    int64_t saved_at, StorageTierKind) {
        return EntityCodec::encode_transcript(t, session_id, saved_at);
    }

    static Transcript decode(const PersistenceRecord& r) {
        return EntityCodec::decode_transcript(r);
    }
};

template <>
struct EntityTraits<HighlightSet> {
    static constexpr const char* kName            = "HighlightSet";
    static constexpr StoreKind   kStore           = StoreKind::highlights;
    static constexpr bool        kHasVolatileTier = false;

    static const std::string& id(const HighlightSet& h) { return h.id; }

    static StorageTierKind tier(const HighlightSet&, const TieringPolicy&) {
        return StorageTierKind::full;
    }

    static PersistenceRecord encode(const HighlightSet& h, const std::string& session_id,
                                    int64_t saved_at, StorageTierKind) {
        return EntityCodec::encode_highlight_set(h, session_id, saved_at);
    }

    static HighlightSet decode(const PersistenceRecord& r) {
        return EntityCodec::decode_highlight_set(r);
    }
};

} // namespace hs
