#include "Config.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

namespace hs {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

/// Whole-string, non-negative integer.
uint64_t parse_count(const std::string& key, const std::string& value) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        throw std::invalid_argument("config key '" + key + "' expects a non-negative integer, got '" +
                                    value + "'");
    }
    std::size_t used = 0;
    uint64_t parsed = 0;
    try {
        parsed = std::stoull(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used != value.size()) {
        throw std::invalid_argument("config key '" + key + "' expects a non-negative integer, got '" +
                                    value + "'");
    }
    return parsed;
}

} // namespace

SessionConfig SessionConfig::load_from_file(const std::string& path) {
    SessionConfig config;

    std::ifstream in(path);
    if (!in.is_open()) {
        return config;
    }

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));

        if (key == "database_path") {
            config.database_path = value;
        } else if (key == "scope") {
            config.scope = value;
        } else if (key == "stale_ttl_ms") {
            const uint64_t ttl = parse_count(key, value);
            if (ttl > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw std::invalid_argument("config key '" + key + "' is out of range, got '" +
                                            value + "'");
            }
            config.stale_ttl_ms = static_cast<int64_t>(ttl);
        } else if (key == "full_tier_max_bytes") {
            config.full_tier_max_bytes = parse_count(key, value);
        } else if (key == "log_level") {
            config.log_level = value;
        }
    }

    return config;
}

} // namespace hs
