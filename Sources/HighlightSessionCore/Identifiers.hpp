#pragma once

#include <cstdint>
#include <string>

namespace hs {

constexpr const char* kSessionIdPrefix = "session_";

/// Current Unix timestamp in milliseconds.
int64_t now_unix_ms();

/// `<prefix><unixMillis>_<9 base-36 chars>`.
std::string generate_id(const std::string& prefix);

std::string generate_session_id();

/// True for ids of the form produced by generate_session_id().
bool is_valid_session_id(const std::string& session_id);

} // namespace hs
