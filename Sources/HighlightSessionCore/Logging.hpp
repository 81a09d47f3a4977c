#pragma once

#include <string>

namespace hs {

/// Set the level of the default spdlog logger from its name
/// (`trace`, `debug`, `info`, `warn`, `error`, `critical`, `off`).
/// Unknown names fall back to `info` and log a warning.
/// Returns true if the name was recognised.
bool configure_logging(const std::string& level);

} // namespace hs
