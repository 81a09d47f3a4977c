#pragma once

#include "HostRuntime.hpp"
#include "StorageTier.hpp"

#include <functional>

namespace hs {

// ---------------------------------------------------------------------------
// State machine
// ---------------------------------------------------------------------------

enum class LifecycleState {
    idle,
    termination_pending,   // closing flag written, process may end
    acknowledged           // same continuation came back, flag cleared
};

enum class LifecycleEvent {
    about_to_terminate,
    restarted,
    cold_start_with_flag,
    cold_start_without_flag
};

/// I/O the adapter performs for a transition.
enum class LifecycleEffect {
    none,
    set_flag,
    clear_flag,
    run_cleanup
};

enum class LifecycleVerdict {
    continuing,
    terminating,
    indeterminate
};

struct LifecycleTransition {
    LifecycleState  next;
    LifecycleEffect effect;
};

const char* state_to_string(LifecycleState s);
const char* verdict_to_string(LifecycleVerdict v);

/// Pure transition function.  Unexpected events leave the state unchanged
/// with no effect.
LifecycleTransition transition(LifecycleState state, LifecycleEvent event);

/// What a state means for the data of the session.
LifecycleVerdict verdict_for(LifecycleState state);

// ---------------------------------------------------------------------------
// LifecycleMonitor
// ---------------------------------------------------------------------------

/// Drives the state machine from host signals and performs its effects
/// against the volatile tier.
///
/// The closing flag is written synchronously in on_about_to_terminate(), so
/// it is in place before control returns to the host.  Cleanup is never
/// attempted at termination time: a flag that survives into the next cold
/// start is the only evidence of a real termination.
class LifecycleMonitor {
public:
    explicit LifecycleMonitor(StorageTier& storage);

    // Non-copyable.
    LifecycleMonitor(const LifecycleMonitor&) = delete;
    LifecycleMonitor& operator=(const LifecycleMonitor&) = delete;

    /// Read the flag left by the previous run.  Returns true if cleanup
    /// must run before anything else.  An unreadable flag counts as absent.
    /// The flag itself is removed by the cleanup transaction, so a failed
    /// cleanup leaves it for the next boot.
    bool on_cold_start();

    /// Best-effort: a storage failure is logged and the state still moves.
    void on_about_to_terminate();

    void on_restarted();

    LifecycleState state() const { return state_; }
    LifecycleVerdict verdict() const { return verdict_for(state_); }

    /// Wire about-to-terminate and restarted.  Cold start stays with the
    /// caller, which has to order it against reaping and restore.
    void attach(HostRuntime& host);

private:
    LifecycleEffect apply(LifecycleEvent event);

    StorageTier&   storage_;
    LifecycleState state_ = LifecycleState::idle;
};

} // namespace hs
