#include "EntityCodec.hpp"

#include "Errors.hpp"

#include <memory>
#include <stdexcept>

#include <json/json.h>

namespace hs {

namespace {

// ---------------------------------------------------------------------------
// JSON helpers
// ---------------------------------------------------------------------------

std::string write_json(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

Json::Value parse_json(const std::string& text, const std::string& what) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw DecodeFailure(what + ": malformed JSON: " + errors);
    }
    if (!root.isObject()) {
        throw DecodeFailure(what + ": root is not an object");
    }
    return root;
}

const Json::Value& member(const Json::Value& obj, const char* key, const std::string& what) {
    if (!obj.isObject() || !obj.isMember(key)) {
        throw DecodeFailure(what + ": missing field '" + key + "'");
    }
    return obj[key];
}

std::string get_string(const Json::Value& obj, const char* key, const std::string& what) {
    const Json::Value& v = member(obj, key, what);
    if (!v.isString()) throw DecodeFailure(what + ": field '" + key + "' is not a string");
    return v.asString();
}

int64_t get_int64(const Json::Value& obj, const char* key, const std::string& what) {
    const Json::Value& v = member(obj, key, what);
    if (!v.isInt64()) throw DecodeFailure(what + ": field '" + key + "' is not an integer");
    return v.asInt64();
}

double get_double(const Json::Value& obj, const char* key, const std::string& what) {
    const Json::Value& v = member(obj, key, what);
    if (!v.isNumeric()) throw DecodeFailure(what + ": field '" + key + "' is not a number");
    return v.asDouble();
}

bool get_bool(const Json::Value& obj, const char* key, const std::string& what) {
    const Json::Value& v = member(obj, key, what);
    if (!v.isBool()) throw DecodeFailure(what + ": field '" + key + "' is not a boolean");
    return v.asBool();
}

const Json::Value& get_array(const Json::Value& obj, const char* key, const std::string& what) {
    const Json::Value& v = member(obj, key, what);
    if (!v.isArray()) throw DecodeFailure(what + ": field '" + key + "' is not an array");
    return v;
}

void require_identity(const PersistenceRecord& record, const std::string& what) {
    if (record.id.empty()) throw DecodeFailure(what + ": record has no id");
    if (record.session_id.empty()) throw DecodeFailure(what + ": record has no session id");
}

StorageTierKind tier_from_string(const std::string& value, const std::string& what) {
    if (value == "full")          return StorageTierKind::full;
    if (value == "metadata-only") return StorageTierKind::metadata_only;
    throw DecodeFailure(what + ": unknown tier '" + value + "'");
}

} // namespace

// ---------------------------------------------------------------------------
// Media
// ---------------------------------------------------------------------------

PersistenceRecord EntityCodec::encode_media(const Media& media,
                                            const std::string& session_id,
                                            int64_t saved_at,
                                            StorageTierKind tier) {
    Json::Value metadata(Json::objectValue);
    metadata["durationSeconds"] = media.metadata.duration_seconds;
    metadata["width"]           = media.metadata.width;
    metadata["height"]          = media.metadata.height;
    metadata["size"]            = static_cast<Json::UInt64>(media.metadata.size_bytes);
    metadata["mimeType"]        = media.metadata.mime_type;
    metadata["name"]            = media.metadata.name;

    Json::Value root(Json::objectValue);
    root["metadata"] = metadata;
    root["tier"]     = tier_to_string(tier);

    PersistenceRecord record;
    record.id         = media.id;
    record.session_id = session_id;
    record.related_id = session_id;
    record.saved_at   = saved_at;
    record.payload    = write_json(root);
    if (tier == StorageTierKind::full && media.bytes) {
        record.blob = *media.bytes;
    }
    return record;
}

Media EntityCodec::decode_media(const PersistenceRecord& record) {
    const std::string what = "media '" + record.id + "'";
    require_identity(record, what);

    const Json::Value root = parse_json(record.payload, what);
    const Json::Value& metadata = member(root, "metadata", what);

    Media media;
    media.id = record.id;
    media.metadata.duration_seconds = get_double(metadata, "durationSeconds", what);
    media.metadata.width            = static_cast<int32_t>(get_int64(metadata, "width", what));
    media.metadata.height           = static_cast<int32_t>(get_int64(metadata, "height", what));
    media.metadata.size_bytes       = static_cast<uint64_t>(get_int64(metadata, "size", what));
    media.metadata.mime_type        = get_string(metadata, "mimeType", what);
    media.metadata.name             = get_string(metadata, "name", what);

    if (tier_from_string(get_string(root, "tier", what), what) == StorageTierKind::full) {
        media.bytes = std::make_shared<const std::vector<uint8_t>>(record.blob);
    }
    return media;
}

StorageTierKind EntityCodec::media_tier(const PersistenceRecord& record) {
    const std::string what = "media '" + record.id + "'";
    return tier_from_string(get_string(parse_json(record.payload, what), "tier", what), what);
}

// ---------------------------------------------------------------------------
// Transcript
// ---------------------------------------------------------------------------

PersistenceRecord EntityCodec::encode_transcript(const Transcript& transcript,
                                                 const std::string& session_id,
                                                 int64_t saved_at) {
    Json::Value sections(Json::arrayValue);
    for (const auto& section : transcript.sections) {
        Json::Value sentences(Json::arrayValue);
        for (const auto& sentence : section.sentences) {
            Json::Value s(Json::objectValue);
            s["id"]                    = sentence.id;
            s["text"]                  = sentence.text;
            s["startMs"]               = static_cast<Json::Int64>(sentence.range.start_ms);
            s["endMs"]                 = static_cast<Json::Int64>(sentence.range.end_ms);
            s["isHighlightSuggestion"] = sentence.is_highlight_suggestion;
            sentences.append(s);
        }
        Json::Value sec(Json::objectValue);
        sec["id"]        = section.id;
        sec["title"]     = section.title;
        sec["sentences"] = sentences;
        sections.append(sec);
    }

    Json::Value root(Json::objectValue);
    root["fullText"] = transcript.full_text;
    root["sections"] = sections;

    PersistenceRecord record;
    record.id         = transcript.id;
    record.session_id = session_id;
    record.related_id = transcript.media_id;
    record.saved_at   = saved_at;
    record.payload    = write_json(root);
    return record;
}

Transcript EntityCodec::decode_transcript(const PersistenceRecord& record) {
    const std::string what = "transcript '" + record.id + "'";
    require_identity(record, what);
    if (record.related_id.empty()) throw DecodeFailure(what + ": no media id");

    const Json::Value root = parse_json(record.payload, what);

    Transcript transcript;
    transcript.id        = record.id;
    transcript.media_id  = record.related_id;
    transcript.full_text = get_string(root, "fullText", what);

    for (const auto& sec : get_array(root, "sections", what)) {
        Section section;
        section.id    = get_string(sec, "id", what);
        section.title = get_string(sec, "title", what);

        for (const auto& s : get_array(sec, "sentences", what)) {
            Sentence sentence;
            sentence.id   = get_string(s, "id", what);
            sentence.text = get_string(s, "text", what);
            try {
                sentence.range = TimeRange::make(get_int64(s, "startMs", what),
                                                 get_int64(s, "endMs", what));
            } catch (const std::invalid_argument& e) {
                throw DecodeFailure(what + ": sentence '" + sentence.id + "': " + e.what());
            }
            sentence.is_highlight_suggestion = get_bool(s, "isHighlightSuggestion", what);
            section.sentences.push_back(std::move(sentence));
        }
        if (section.sentences.empty()) {
            throw DecodeFailure(what + ": section '" + section.id + "' has no sentences");
        }
        transcript.sections.push_back(std::move(section));
    }
    return transcript;
}

// ---------------------------------------------------------------------------
// HighlightSet
// ---------------------------------------------------------------------------

PersistenceRecord EntityCodec::encode_highlight_set(const HighlightSet& highlight,
                                                    const std::string& session_id,
                                                    int64_t saved_at) {
    Json::Value ids(Json::arrayValue);
    for (const auto& id : highlight.selected_sentence_ids) ids.append(id);

    Json::Value root(Json::objectValue);
    root["name"]                = highlight.name;
    root["selectedSentenceIds"] = ids;

    PersistenceRecord record;
    record.id         = highlight.id;
    record.session_id = session_id;
    record.related_id = highlight.media_id;
    record.saved_at   = saved_at;
    record.payload    = write_json(root);
    return record;
}

HighlightSet EntityCodec::decode_highlight_set(const PersistenceRecord& record) {
    const std::string what = "highlight '" + record.id + "'";
    require_identity(record, what);
    if (record.related_id.empty()) throw DecodeFailure(what + ": no media id");

    const Json::Value root = parse_json(record.payload, what);

    HighlightSet highlight;
    highlight.id       = record.id;
    highlight.media_id = record.related_id;
    highlight.name     = get_string(root, "name", what);
    for (const auto& id : get_array(root, "selectedSentenceIds", what)) {
        if (!id.isString()) throw DecodeFailure(what + ": sentence id is not a string");
        highlight.add_sentence(id.asString());
    }
    return highlight;
}

// ---------------------------------------------------------------------------
// SessionRecord
// ---------------------------------------------------------------------------

PersistenceRecord EntityCodec::encode_session(const SessionRecord& session) {
    Json::Value root(Json::objectValue);
    root["createdAt"]   = static_cast<Json::Int64>(session.created_at);
    root["lastSavedAt"] = static_cast<Json::Int64>(session.last_saved_at);

    PersistenceRecord record;
    record.id         = session.session_id;
    record.session_id = session.session_id;
    record.saved_at   = session.last_saved_at;
    record.payload    = write_json(root);
    return record;
}

SessionRecord EntityCodec::decode_session(const PersistenceRecord& record) {
    const std::string what = "session '" + record.id + "'";
    require_identity(record, what);

    const Json::Value root = parse_json(record.payload, what);

    SessionRecord session;
    session.session_id    = record.id;
    session.created_at    = get_int64(root, "createdAt", what);
    session.last_saved_at = get_int64(root, "lastSavedAt", what);
    return session;
}

// ---------------------------------------------------------------------------
// Volatile values
// ---------------------------------------------------------------------------

std::string EntityCodec::record_to_volatile(const PersistenceRecord& record) {
    Json::Value root(Json::objectValue);
    root["id"]        = record.id;
    root["sessionId"] = record.session_id;
    root["relatedId"] = record.related_id;
    root["savedAt"]   = static_cast<Json::Int64>(record.saved_at);
    root["payload"]   = record.payload;
    return write_json(root);
}

PersistenceRecord EntityCodec::record_from_volatile(const std::string& value) {
    const std::string what = "volatile record";
    const Json::Value root = parse_json(value, what);

    PersistenceRecord record;
    record.id         = get_string(root, "id", what);
    record.session_id = get_string(root, "sessionId", what);
    record.related_id = get_string(root, "relatedId", what);
    record.saved_at   = get_int64(root, "savedAt", what);
    record.payload    = get_string(root, "payload", what);
    return record;
}

std::string EntityCodec::encode_closing_flag(bool is_closing) {
    Json::Value root(Json::objectValue);
    root["isClosing"] = is_closing;
    return write_json(root);
}

bool EntityCodec::decode_closing_flag(const std::string& value) {
    return get_bool(parse_json(value, "closing flag"), "isClosing", "closing flag");
}

} // namespace hs
