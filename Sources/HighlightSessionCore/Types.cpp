#include "Types.hpp"

#include <algorithm>
#include <stdexcept>

namespace hs {

// ---------------------------------------------------------------------------
// TimeRange
// ---------------------------------------------------------------------------

TimeRange TimeRange::make(int64_t start_ms, int64_t end_ms) {
    if (start_ms < 0) {
        throw std::invalid_argument("TimeRange start cannot be negative");
    }
    if (end_ms < start_ms) {
        throw std::invalid_argument("TimeRange end cannot be earlier than start");
    }
    return TimeRange{start_ms, end_ms};
}

// ---------------------------------------------------------------------------
// Section / Transcript
// ---------------------------------------------------------------------------

TimeRange Section::time_range() const {
    if (sentences.empty()) {
        throw std::logic_error("Section '" + id + "' has no sentences");
    }
    return TimeRange{sentences.front().range.start_ms, sentences.back().range.end_ms};
}

const Sentence* Transcript::find_sentence(const std::string& sentence_id) const {
    for (const auto& section : sections) {
        for (const auto& sentence : section.sentences) {
            if (sentence.id == sentence_id) return &sentence;
        }
    }
    return nullptr;
}

const Section* Transcript::find_section(const std::string& section_id) const {
    auto it = std::find_if(sections.begin(), sections.end(),
                           [&](const Section& s) { return s.id == section_id; });
    return it == sections.end() ? nullptr : &*it;
}

std::vector<Sentence> Transcript::all_sentences() const {
    std::vector<Sentence> out;
    for (const auto& section : sections) {
        out.insert(out.end(), section.sentences.begin(), section.sentences.end());
    }
    return out;
}

// ---------------------------------------------------------------------------
// HighlightSet
// ---------------------------------------------------------------------------

bool HighlightSet::is_selected(const std::string& sentence_id) const {
    return std::find(selected_sentence_ids.begin(), selected_sentence_ids.end(),
                     sentence_id) != selected_sentence_ids.end();
}

void HighlightSet::add_sentence(const std::string& sentence_id) {
    if (!is_selected(sentence_id)) {
        selected_sentence_ids.push_back(sentence_id);
    }
}

void HighlightSet::remove_sentence(const std::string& sentence_id) {
    selected_sentence_ids.erase(
        std::remove(selected_sentence_ids.begin(), selected_sentence_ids.end(), sentence_id),
        selected_sentence_ids.end());
}

void HighlightSet::toggle_sentence(const std::string& sentence_id) {
    if (is_selected(sentence_id)) {
        remove_sentence(sentence_id);
    } else {
        add_sentence(sentence_id);
    }
}

} // namespace hs
