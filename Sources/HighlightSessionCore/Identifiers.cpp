#include "Identifiers.hpp"

#include <cctype>
#include <chrono>
#include <cstring>
#include <random>

namespace hs {

namespace {

constexpr int kRandomSuffixLength = 9;

} // namespace

int64_t now_unix_ms() {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

std::string generate_id(const std::string& prefix) {
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist(0, 35);

    const char* alphabet = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::string id = prefix + std::to_string(now_unix_ms()) + "_";
    id.reserve(id.size() + kRandomSuffixLength);
    for (int i = 0; i < kRandomSuffixLength; ++i) {
        id += alphabet[dist(rng)];
    }
    return id;
}

std::string generate_session_id() {
    return generate_id(kSessionIdPrefix);
}

bool is_valid_session_id(const std::string& session_id) {
    const std::size_t prefix_len = std::strlen(kSessionIdPrefix);
    if (session_id.compare(0, prefix_len, kSessionIdPrefix) != 0) return false;

    std::size_t i = prefix_len;
    std::size_t digits = 0;
    while (i < session_id.size() && std::isdigit(static_cast<unsigned char>(session_id[i]))) {
        ++i;
        ++digits;
    }
    if (digits == 0 || i >= session_id.size() || session_id[i] != '_') return false;
    ++i;

    if (i >= session_id.size()) return false;
    for (; i < session_id.size(); ++i) {
        const char c = session_id[i];
        if (!(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'z'))) {
            return false;
        }
    }
    return true;
}

} // namespace hs
