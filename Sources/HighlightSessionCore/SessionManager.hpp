#pragma once

#include "Config.hpp"
#include "EntityStore.hpp"
#include "HostRuntime.hpp"
#include "Identifiers.hpp"
#include "LifecycleMonitor.hpp"
#include "SessionCleanupService.hpp"
#include "SessionRegistry.hpp"
#include "SessionRestoreService.hpp"
#include "StaleSessionReaper.hpp"
#include "StorageTier.hpp"
#include "TieringPolicy.hpp"
#include "Types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace hs {

enum class BootOutcome {
    fresh,           // nothing stored for this session
    restored,        // state rebuilt from storage
    cleaned_up,      // previous run terminated, its data was deleted
    incomplete,      // media without transcript or highlight
    cleanup_failed   // directive found but the deletion rolled back
};

const char* outcome_to_string(BootOutcome o);

struct BootReport {
    BootOutcome                 outcome = BootOutcome::fresh;
    std::optional<SessionState> state;
    std::string                 message;
};

struct DeleteSessionResult {
    bool        success = false;
    std::string error;   // empty on success
};

/// Owns the whole persistence stack and runs the boot sequence:
///
///   open registry  -->  reap stale sessions  -->  closing flag?
///                                                  |          |
///                                                 yes         no
///                                                  |          |
///                                               cleanup    restore
///
/// When the database cannot be opened the manager runs on a
/// MemoryStorageTier: nothing survives the process but every operation
/// keeps working.
class SessionManager {
public:
    /// Open the SQLite database named by `config`, falling back to memory.
    explicit SessionManager(const SessionConfig& config, Clock clock = now_unix_ms);

    /// Run on caller-supplied storage, which must outlive the manager.
    SessionManager(StorageTier& storage, const SessionConfig& config,
                   Clock clock = now_unix_ms);

    ~SessionManager();

    // Non-copyable.
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Boot sequence.  Never throws for storage reasons; the report says
    /// what happened.
    BootReport start();

    /// Run start() on the host's cold-start signal and hand termination and
    /// restart signals to the lifecycle monitor.
    void attach(HostRuntime& host);

    /// Report of the last start(), if any.
    const std::optional<BootReport>& last_boot() const { return last_boot_; }

    /// User-initiated deletion of the current session.  A new session
    /// begins on success.
    DeleteSessionResult delete_session();

    // ---- Components ----

    MediaStore&        media() { return media_; }
    TranscriptStore&   transcripts() { return transcripts_; }
    HighlightSetStore& highlights() { return highlights_; }
    SessionRegistry&   registry() { return registry_; }
    LifecycleMonitor&  monitor() { return monitor_; }
    StorageTier&       storage() { return storage_; }

    const SessionConfig& config() const { return config_; }
    const std::string&   session_id() const { return registry_.session_id(); }

    /// True only when the storage is a SqliteStorageTier.
    bool is_durable() const { return durable_; }

    /// Used by restore to materialize a handle for media with bytes.
    void set_media_provider(MediaReferenceProvider* provider) { restore_.set_provider(provider); }

private:
    SessionConfig                config_;
    std::unique_ptr<StorageTier> owned_storage_;
    bool                         durable_ = false;

    StorageTier&          storage_;
    SessionRegistry       registry_;
    SessionContext        context_;
    TieringPolicy         policy_;
    MediaStore            media_;
    TranscriptStore       transcripts_;
    HighlightSetStore     highlights_;
    LifecycleMonitor      monitor_;
    StaleSessionReaper    reaper_;
    SessionRestoreService restore_;
    SessionCleanupService cleanup_;

    std::optional<BootReport> last_boot_;
};

} // namespace hs
