#pragma once

#include "EntityStore.hpp"
#include "HostRuntime.hpp"
#include "Types.hpp"

#include <optional>

namespace hs {

/// Reassembles the current session from the entity stores.
///
/// Returns nullopt when no Media was ever stored: a fresh start is not an
/// error.  A Media whose Transcript or HighlightSets are missing throws
/// IncompleteSessionDataError.  Cross-entity references are checked here
/// and not at write time: highlight sentence ids unknown to the transcript
/// are dropped with a warning.
class SessionRestoreService {
public:
    SessionRestoreService(MediaStore& media,
                          TranscriptStore& transcripts,
                          HighlightSetStore& highlights,
                          MediaReferenceProvider* provider = nullptr);

    // Non-copyable.
    SessionRestoreService(const SessionRestoreService&) = delete;
    SessionRestoreService& operator=(const SessionRestoreService&) = delete;

    std::optional<SessionState> restore();

    void set_provider(MediaReferenceProvider* provider) { provider_ = provider; }

private:
    MediaStore&             media_;
    TranscriptStore&        transcripts_;
    HighlightSetStore&      highlights_;
    MediaReferenceProvider* provider_;
};

} // namespace hs
