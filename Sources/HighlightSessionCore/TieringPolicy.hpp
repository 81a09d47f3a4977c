#pragma once

#include "Types.hpp"

#include <cstdint>

namespace hs {

/// 50 MiB: the largest Media persisted with its payload.
constexpr uint64_t kDefaultFullTierMaxBytes = 50ull * 1024 * 1024;

/// Size-based tier decision for Media records.
///
/// The boundary is inclusive on the full side: a payload of exactly
/// `full_tier_max_bytes` is stored in full, one byte more is stored
/// metadata-only.
class TieringPolicy {
public:
    explicit TieringPolicy(uint64_t full_tier_max_bytes = kDefaultFullTierMaxBytes)
        : full_tier_max_bytes_(full_tier_max_bytes) {}

    StorageTierKind choose_tier(uint64_t size_bytes) const {
        return size_bytes <= full_tier_max_bytes_ ? StorageTierKind::full
                                                  : StorageTierKind::metadata_only;
    }

    uint64_t full_tier_max_bytes() const { return full_tier_max_bytes_; }

private:
    uint64_t full_tier_max_bytes_;
};

} // namespace hs
