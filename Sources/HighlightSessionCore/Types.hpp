#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hs {

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

/// Where a Media record is persisted.
enum class StorageTierKind {
    full,           // payload + metadata, durable tier
    metadata_only   // metadata only, volatile tier
};

/// Convert tier enum to the string stored in record payloads.
inline const char* tier_to_string(StorageTierKind t) {
    switch (t) {
        case StorageTierKind::full:          return "full";
        case StorageTierKind::metadata_only: return "metadata-only";
    }
    return "full";
}

/// The durable stores.  `sessions` holds SessionRecords.
enum class StoreKind {
    media,
    transcripts,
    highlights,
    sessions
};

inline const char* store_to_string(StoreKind s) {
    switch (s) {
        case StoreKind::media:       return "media";
        case StoreKind::transcripts: return "transcripts";
        case StoreKind::highlights:  return "highlights";
        case StoreKind::sessions:    return "sessions";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Value types
// ---------------------------------------------------------------------------

/// Timing of a sentence within the media: [start_ms, end_ms].
struct TimeRange {
    int64_t start_ms = 0;
    int64_t end_ms   = 0;

    /// Throws std::invalid_argument if end precedes start or start is negative.
    static TimeRange make(int64_t start_ms, int64_t end_ms);

    int64_t duration_ms() const { return end_ms - start_ms; }
    bool contains(int64_t ms) const { return ms >= start_ms && ms <= end_ms; }
};

struct MediaMetadata {
    double      duration_seconds = 0.0;
    int32_t     width            = 0;
    int32_t     height           = 0;
    uint64_t    size_bytes       = 0;
    std::string mime_type;
    std::string name;
};

/// Shared, immutable media payload.  Null means "needs re-supply".
using MediaBytes = std::shared_ptr<const std::vector<uint8_t>>;

// ---------------------------------------------------------------------------
// Entities
// ---------------------------------------------------------------------------

struct Media {
    std::string   id;
    MediaMetadata metadata;
    MediaBytes    bytes;

    bool has_payload() const { return bytes != nullptr; }
};

struct Sentence {
    std::string id;
    std::string text;
    TimeRange   range;
    bool        is_highlight_suggestion = false;
};

struct Section {
    std::string           id;
    std::string           title;
    std::vector<Sentence> sentences;

    /// From the first sentence's start to the last sentence's end.
    /// Throws std::logic_error on an empty section.
    TimeRange time_range() const;
};

struct Transcript {
    std::string          id;
    std::string          media_id;
    std::vector<Section> sections;
    std::string          full_text;

    const Sentence* find_sentence(const std::string& sentence_id) const;
    const Section* find_section(const std::string& section_id) const;
    std::vector<Sentence> all_sentences() const;
};

/// One named selection of transcript sentences, kept in selection order.
struct HighlightSet {
    std::string              id;
    std::string              media_id;
    std::string              name;
    std::vector<std::string> selected_sentence_ids;

    bool is_selected(const std::string& sentence_id) const;
    void add_sentence(const std::string& sentence_id);
    void remove_sentence(const std::string& sentence_id);
    void toggle_sentence(const std::string& sentence_id);
    std::size_t selected_count() const { return selected_sentence_ids.size(); }
};

/// One session at rest.
struct SessionRecord {
    std::string session_id;
    int64_t     created_at    = 0;   // Unix ms
    int64_t     last_saved_at = 0;   // Unix ms
};

/// Everything a restore hands back to the layer above.
struct SessionState {
    Media                      media;
    Transcript                 transcript;
    std::vector<HighlightSet>  highlights;
    bool                       needs_resupply = false;
    std::optional<std::string> media_handle;   // set when a provider materialized one
};

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

/// Flat record handed to a StorageTier.  Produced and consumed by EntityCodec.
struct PersistenceRecord {
    std::string          id;
    std::string          session_id;
    std::string          related_id;
    int64_t              saved_at = 0;    // Unix ms
    std::string          payload;         // JSON document
    std::vector<uint8_t> blob;            // media bytes, empty otherwise
};

// ---------------------------------------------------------------------------
// Callback types
// ---------------------------------------------------------------------------

/// Returns the current time in Unix milliseconds.
using Clock = std::function<int64_t()>;

} // namespace hs
