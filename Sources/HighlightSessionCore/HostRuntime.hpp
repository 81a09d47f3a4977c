#pragma once

#include "Types.hpp"

#include <functional>
#include <string>

namespace hs {

/// Lifecycle signals delivered by the host environment.
///
/// Each registration replaces the previous handler of the same kind.
/// Handlers run on the host's thread and must return promptly.
class HostRuntime {
public:
    using Handler = std::function<void()>;

    virtual ~HostRuntime() = default;

    /// The host may end the process after this fires.  Nothing is
    /// guaranteed to run afterwards.
    virtual void on_about_to_terminate(Handler handler) = 0;

    /// Fired once normal startup has completed in the same continuation,
    /// i.e. a reload rather than a new process.
    virtual void on_restarted(Handler handler) = 0;

    /// Fired once per process boot, before any UI work.
    virtual void on_cold_start(Handler handler) = 0;
};

/// Turns stored media bytes into a playable handle for the layer above.
/// The handle is opaque here.  Throws std::runtime_error on failure.
class MediaReferenceProvider {
public:
    virtual ~MediaReferenceProvider() = default;

    virtual std::string materialize(const MediaBytes& bytes) = 0;
};

} // namespace hs
