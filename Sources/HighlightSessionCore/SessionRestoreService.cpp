#include "SessionRestoreService.hpp"

#include "Errors.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace hs {

SessionRestoreService::SessionRestoreService(MediaStore& media,
                                             TranscriptStore& transcripts,
                                             HighlightSetStore& highlights,
                                             MediaReferenceProvider* provider)
    : media_(media), transcripts_(transcripts), highlights_(highlights), provider_(provider) {}

std::optional<SessionState> SessionRestoreService::restore() {
    // Newest first, so the front is the most recently saved Media.
    std::vector<Media> media = media_.find_all();
    if (media.empty()) {
        spdlog::info("[SessionRestore] nothing to restore");
        return std::nullopt;
    }
    if (media.size() > 1) {
        spdlog::warn("[SessionRestore] {} media records in session, restoring the newest ({})",
                     media.size(), media.front().id);
    }

    SessionState state;
    state.media = media.front();

    std::vector<Transcript> transcripts = transcripts_.find_by_related_id(state.media.id);
    if (transcripts.empty()) {
        throw IncompleteSessionDataError("transcript missing for media " + state.media.id);
    }
    state.transcript = transcripts.front();

    state.highlights = highlights_.find_by_related_id(state.media.id);
    if (state.highlights.empty()) {
        throw IncompleteSessionDataError("highlight missing for media " + state.media.id);
    }

    for (auto& highlight : state.highlights) {
        std::vector<std::string> kept;
        kept.reserve(highlight.selected_sentence_ids.size());
        for (const auto& sentence_id : highlight.selected_sentence_ids) {
            if (state.transcript.find_sentence(sentence_id)) {
                kept.push_back(sentence_id);
            } else {
                spdlog::warn("[SessionRestore] highlight {} references unknown sentence {}",
                             highlight.id, sentence_id);
            }
        }
        highlight.selected_sentence_ids = std::move(kept);
    }

    state.needs_resupply = !state.media.has_payload();

    if (provider_ && state.media.has_payload()) {
        try {
            state.media_handle = provider_->materialize(state.media.bytes);
        } catch (const std::runtime_error& e) {
            spdlog::warn("[SessionRestore] cannot materialize media {}: {}", state.media.id, e.what());
        }
    }

    spdlog::info("[SessionRestore] restored media {} with {} highlight(s){}",
                 state.media.id, state.highlights.size(),
                 state.needs_resupply ? ", media needs re-supply" : "");
    return state;
}

} // namespace hs
