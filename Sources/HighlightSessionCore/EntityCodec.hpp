#pragma once

#include "Types.hpp"

#include <string>

namespace hs {

/// Converts entities to and from flat PersistenceRecords.
///
/// Pure functions, no I/O.  Every decode_* throws DecodeFailure when the
/// record does not have the expected shape; callers treat that as "not
/// found".
struct EntityCodec {
    // ---- Media ----

    /// `related_id` is the session id.  The blob is filled only for the
    /// full tier.
    static PersistenceRecord encode_media(const Media& media,
                                          const std::string& session_id,
                                          int64_t saved_at,
                                          StorageTierKind tier);
    static Media decode_media(const PersistenceRecord& record);
    static StorageTierKind media_tier(const PersistenceRecord& record);

    // ---- Transcript ----

    /// `related_id` is the media id.
    static PersistenceRecord encode_transcript(const Transcript& transcript,
                                               const std::string& session_id,
                                               int64_t saved_at);
    static Transcript decode_transcript(const PersistenceRecord& record);

    // ---- HighlightSet ----

    /// `related_id` is the media id.
    static PersistenceRecord encode_highlight_set(const HighlightSet& highlight,
                                                  const std::string& session_id,
                                                  int64_t saved_at);
    static HighlightSet decode_highlight_set(const PersistenceRecord& record);

    // ---- SessionRecord ----

    static PersistenceRecord encode_session(const SessionRecord& session);
    static SessionRecord decode_session(const PersistenceRecord& record);

    // ---- Volatile values ----

    /// Serialize a whole record (minus its blob) into one volatile value.
    static std::string record_to_volatile(const PersistenceRecord& record);
    static PersistenceRecord record_from_volatile(const std::string& value);

    /// `{ "isClosing": <flag> }`
    static std::string encode_closing_flag(bool is_closing);
    static bool decode_closing_flag(const std::string& value);
};

} // namespace hs
