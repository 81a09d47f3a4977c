#include "Logging.hpp"

#include <optional>

#include <spdlog/spdlog.h>

namespace hs {

namespace {

std::optional<spdlog::level::level_enum> level_from_string(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    if (s == "off")      return spdlog::level::off;
    return std::nullopt;
}

} // namespace

bool configure_logging(const std::string& level) {
    auto parsed = level_from_string(level);
    spdlog::set_level(parsed.value_or(spdlog::level::info));
    if (!parsed) {
        spdlog::warn("[Logging] unknown log level '{}', using info", level);
        return false;
    }
    return true;
}

} // namespace hs
