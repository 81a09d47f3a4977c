#include "LifecycleMonitor.hpp"

#include "EntityCodec.hpp"
#include "Errors.hpp"

#include <spdlog/spdlog.h>

namespace hs {

// ---------------------------------------------------------------------------
// Pure state machine
// ---------------------------------------------------------------------------

const char* state_to_string(LifecycleState s) {
    switch (s) {
        case LifecycleState::idle:                return "idle";
        case LifecycleState::termination_pending: return "termination_pending";
        case LifecycleState::acknowledged:        return "acknowledged";
    }
    return "idle";
}

const char* verdict_to_string(LifecycleVerdict v) {
    switch (v) {
        case LifecycleVerdict::continuing:    return "continuing";
        case LifecycleVerdict::terminating:   return "terminating";
        case LifecycleVerdict::indeterminate: return "indeterminate";
    }
    return "indeterminate";
}

LifecycleTransition transition(LifecycleState state, LifecycleEvent event) {
    switch (event) {
        // A boot always starts from idle, whatever an earlier run left in memory.
        case LifecycleEvent::cold_start_with_flag:
            return {LifecycleState::idle, LifecycleEffect::run_cleanup};
        case LifecycleEvent::cold_start_without_flag:
            return {LifecycleState::idle, LifecycleEffect::none};

        case LifecycleEvent::about_to_terminate:
            if (state == LifecycleState::termination_pending) {
                return {state, LifecycleEffect::none};
            }
            return {LifecycleState::termination_pending, LifecycleEffect::set_flag};

        case LifecycleEvent::restarted:
            if (state == LifecycleState::termination_pending) {
                return {LifecycleState::acknowledged, LifecycleEffect::clear_flag};
            }
            // No directive of ours to withdraw.  A flag left by an earlier run
            // belongs to the cold-start check.
            return {state, LifecycleEffect::none};
    }
    return {state, LifecycleEffect::none};
}

LifecycleVerdict verdict_for(LifecycleState state) {
    switch (state) {
        case LifecycleState::termination_pending: return LifecycleVerdict::terminating;
        case LifecycleState::acknowledged:        return LifecycleVerdict::continuing;
        case LifecycleState::idle:                return LifecycleVerdict::indeterminate;
    }
    return LifecycleVerdict::indeterminate;
}

// ---------------------------------------------------------------------------
// LifecycleMonitor
// ---------------------------------------------------------------------------

LifecycleMonitor::LifecycleMonitor(StorageTier& storage) : storage_(storage) {}

bool LifecycleMonitor::on_cold_start() {
    bool flag_set = false;
    try {
        if (auto value = storage_.get_volatile(kClosingFlagKey)) {
            flag_set = EntityCodec::decode_closing_flag(*value);
        }
    } catch (const SessionError& e) {
        spdlog::warn("[LifecycleMonitor] cannot read closing flag, assuming none: {}", e.what());
    }

    const LifecycleEffect effect = apply(flag_set ? LifecycleEvent::cold_start_with_flag
                                                  : LifecycleEvent::cold_start_without_flag);
    if (effect == LifecycleEffect::run_cleanup) {
        spdlog::info("[LifecycleMonitor] closing flag found: previous run terminated");
        return true;
    }
    return false;
}

void LifecycleMonitor::on_about_to_terminate() {
    if (apply(LifecycleEvent::about_to_terminate) != LifecycleEffect::set_flag) return;

    try {
        storage_.put_volatile(kClosingFlagKey, EntityCodec::encode_closing_flag(true));
    } catch (const StorageUnavailable& e) {
        spdlog::warn("[LifecycleMonitor] failed to set closing flag: {}", e.what());
    }
}

void LifecycleMonitor::on_restarted() {
    if (apply(LifecycleEvent::restarted) != LifecycleEffect::clear_flag) return;

    try {
        storage_.remove_volatile(kClosingFlagKey);
        spdlog::info("[LifecycleMonitor] restarted in place, closing flag cleared");
    } catch (const StorageUnavailable& e) {
        spdlog::warn("[LifecycleMonitor] failed to clear closing flag: {}", e.what());
    }
}

void LifecycleMonitor::attach(HostRuntime& host) {
    host.on_about_to_terminate([this] { on_about_to_terminate(); });
    host.on_restarted([this] { on_restarted(); });
}

LifecycleEffect LifecycleMonitor::apply(LifecycleEvent event) {
    const LifecycleTransition t = transition(state_, event);
    if (t.next != state_) {
        spdlog::debug("[LifecycleMonitor] {} -> {} ({})", state_to_string(state_),
                      state_to_string(t.next), verdict_to_string(verdict_for(t.next)));
    }
    state_ = t.next;
    return t.effect;
}

} // namespace hs
