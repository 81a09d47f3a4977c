#include "HighlightService.hpp"

#include <algorithm>

namespace hs {
namespace HighlightService {

std::vector<Sentence> selected_sentences(const HighlightSet& highlight,
                                         const Transcript& transcript,
                                         SentenceOrder order) {
    std::vector<Sentence> sentences;
    sentences.reserve(highlight.selected_sentence_ids.size());
    for (const auto& id : highlight.selected_sentence_ids) {
        if (const Sentence* s = transcript.find_sentence(id)) {
            sentences.push_back(*s);
        }
    }

    if (order == SentenceOrder::time) {
        std::stable_sort(sentences.begin(), sentences.end(),
                         [](const Sentence& a, const Sentence& b) {
                             return a.range.start_ms < b.range.start_ms;
                         });
    }
    return sentences;
}

std::vector<TimeRange> time_ranges(const HighlightSet& highlight,
                                   const Transcript& transcript,
                                   SentenceOrder order) {
    std::vector<TimeRange> ranges;
    for (const auto& s : selected_sentences(highlight, transcript, order)) {
        ranges.push_back(s.range);
    }
    return ranges;
}

int64_t total_duration_ms(const HighlightSet& highlight, const Transcript& transcript) {
    int64_t total = 0;
    for (const auto& s : selected_sentences(highlight, transcript, SentenceOrder::time)) {
        total += s.range.duration_ms();
    }
    return total;
}

} // namespace HighlightService
} // namespace hs
