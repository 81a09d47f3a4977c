#pragma once

#include "StaleSessionReaper.hpp"
#include "TieringPolicy.hpp"

#include <cstdint>
#include <string>

namespace hs {

struct SessionConfig {
    std::string database_path{"highlight-session.db"};
    std::string scope{"default"};
    int64_t     stale_ttl_ms{kDefaultStaleTtlMs};
    uint64_t    full_tier_max_bytes{kDefaultFullTierMaxBytes};
    std::string log_level{"info"};

    /// `key = value` lines, `#` comments.  A missing file yields the
    /// defaults and unknown keys are ignored.  Throws std::invalid_argument
    /// naming the key when a number does not parse.
    static SessionConfig load_from_file(const std::string& path);
};

} // namespace hs
