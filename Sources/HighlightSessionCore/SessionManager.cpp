#include "SessionManager.hpp"

#include "Errors.hpp"
#include "Logging.hpp"
#include "MemoryStorageTier.hpp"
#include "SqliteStorageTier.hpp"

#include <spdlog/spdlog.h>

namespace hs {

namespace {

std::unique_ptr<StorageTier> open_storage(const SessionConfig& config) {
    auto db = std::make_unique<SqliteStorageTier>(config.database_path, config.scope);
    if (db->open()) {
        return db;
    }
    spdlog::error("[SessionManager] cannot open {}, running without durable storage",
                  config.database_path);
    return std::make_unique<MemoryStorageTier>();
}

} // namespace

const char* outcome_to_string(BootOutcome o) {
    switch (o) {
        case BootOutcome::fresh:          return "fresh";
        case BootOutcome::restored:       return "restored";
        case BootOutcome::cleaned_up:     return "cleanedUp";
        case BootOutcome::incomplete:     return "incomplete";
        case BootOutcome::cleanup_failed: return "cleanupFailed";
    }
    return "fresh";
}

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

SessionManager::SessionManager(const SessionConfig& config, Clock clock)
    : config_(config),
      owned_storage_(open_storage(config_)),
      durable_(dynamic_cast<SqliteStorageTier*>(owned_storage_.get()) != nullptr),
      storage_(*owned_storage_),
      registry_(storage_, std::move(clock)),
      context_(registry_),
      policy_(config_.full_tier_max_bytes),
      media_(storage_, context_, policy_),
      transcripts_(storage_, context_, policy_),
      highlights_(storage_, context_, policy_),
      monitor_(storage_),
      reaper_(storage_, context_, config_.stale_ttl_ms),
      restore_(media_, transcripts_, highlights_),
      cleanup_(storage_, context_, {&media_, &transcripts_, &highlights_}) {
    configure_logging(config_.log_level);
}

SessionManager::SessionManager(StorageTier& storage, const SessionConfig& config, Clock clock)
    : config_(config),
      durable_(dynamic_cast<SqliteStorageTier*>(&storage) != nullptr),
      storage_(storage),
      registry_(storage_, std::move(clock)),
      context_(registry_),
      policy_(config_.full_tier_max_bytes),
      media_(storage_, context_, policy_),
      transcripts_(storage_, context_, policy_),
      highlights_(storage_, context_, policy_),
      monitor_(storage_),
      reaper_(storage_, context_, config_.stale_ttl_ms),
      restore_(media_, transcripts_, highlights_),
      cleanup_(storage_, context_, {&media_, &transcripts_, &highlights_}) {}

SessionManager::~SessionManager() = default;

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------

BootReport SessionManager::start() {
    BootReport report;

    registry_.open();
    reaper_.reap();

    if (monitor_.on_cold_start()) {
        try {
            cleanup_.execute();
            registry_.open();
            report.outcome = BootOutcome::cleaned_up;
            report.message = "previous session ended, its data was deleted";
        } catch (const CleanupError& e) {
            // The flag stays set, so the next boot tries again.
            spdlog::error("[SessionManager] {}", e.what());
            report.outcome = BootOutcome::cleanup_failed;
            report.message = "failed to delete session data";
        }
    } else {
        try {
            report.state = restore_.restore();
            if (!report.state) {
                report.outcome = BootOutcome::fresh;
            } else {
                report.outcome = BootOutcome::restored;
                report.message = report.state->needs_resupply
                                     ? "please re-provide the media file to continue"
                                     : "previous session restored";
            }
        } catch (const IncompleteSessionDataError& e) {
            spdlog::warn("[SessionManager] {}", e.what());
            report.outcome = BootOutcome::incomplete;
            report.message = "could not restore previous session, please start over";
        }
    }

    spdlog::info("[SessionManager] boot of {} finished: {}",
                 registry_.session_id(), outcome_to_string(report.outcome));
    last_boot_ = report;
    return report;
}

// ---------------------------------------------------------------------------
// attach
// ---------------------------------------------------------------------------

void SessionManager::attach(HostRuntime& host) {
    host.on_cold_start([this] { start(); });
    monitor_.attach(host);
}

// ---------------------------------------------------------------------------
// delete_session
// ---------------------------------------------------------------------------

DeleteSessionResult SessionManager::delete_session() {
    if (!is_valid_session_id(registry_.session_id())) {
        return {false, "no active session"};
    }

    try {
        cleanup_.execute();
    } catch (const CleanupError& e) {
        spdlog::error("[SessionManager] {}", e.what());
        return {false, "failed to delete session data"};
    }

    registry_.open();
    return {true, ""};
}

} // namespace hs
