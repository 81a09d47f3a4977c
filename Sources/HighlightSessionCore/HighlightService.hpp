#pragma once

#include "Types.hpp"

#include <cstdint>
#include <vector>

namespace hs {

enum class SentenceOrder {
    selection,   // order in which the sentences were selected
    time         // by start time
};

/// Read-only queries joining a HighlightSet with its Transcript.
/// Selected ids the transcript does not know are skipped.
namespace HighlightService {

std::vector<Sentence> selected_sentences(const HighlightSet& highlight,
                                         const Transcript& transcript,
                                         SentenceOrder order);

std::vector<TimeRange> time_ranges(const HighlightSet& highlight,
                                   const Transcript& transcript,
                                   SentenceOrder order);

/// Sum of the selected sentences' durations in milliseconds.
int64_t total_duration_ms(const HighlightSet& highlight, const Transcript& transcript);

} // namespace HighlightService

} // namespace hs
