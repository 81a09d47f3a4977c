#include "SessionRegistry.hpp"

#include "EntityCodec.hpp"
#include "Errors.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace hs {

SessionRegistry::SessionRegistry(StorageTier& storage, Clock clock)
    : storage_(storage), clock_(std::move(clock)) {}

// ---------------------------------------------------------------------------
// open / close
// ---------------------------------------------------------------------------

const std::string& SessionRegistry::open() {
    if (is_open()) return session_id_;

    std::string id;
    try {
        if (auto stored = storage_.get_volatile(kSessionIdKey)) {
            if (is_valid_session_id(*stored)) {
                id = *stored;
            } else {
                spdlog::warn("[SessionRegistry] ignoring malformed stored session id '{}'", *stored);
            }
        }
    } catch (const StorageUnavailable& e) {
        spdlog::warn("[SessionRegistry] cannot read stored session id: {}", e.what());
    }

    if (id.empty()) {
        id = generate_session_id();
        try {
            storage_.put_volatile(kSessionIdKey, id);
        } catch (const StorageUnavailable& e) {
            spdlog::warn("[SessionRegistry] cannot store session id: {}", e.what());
        }
        spdlog::info("[SessionRegistry] started session {}", id);
    } else {
        spdlog::info("[SessionRegistry] resumed session {}", id);
    }

    session_id_ = id;
    record_.reset();

    try {
        if (auto row = storage_.get_durable(StoreKind::sessions, session_id_)) {
            record_ = EntityCodec::decode_session(*row);
        }
    } catch (const SessionError& e) {
        spdlog::warn("[SessionRegistry] cannot load record for {}: {}", session_id_, e.what());
    }

    return session_id_;
}

void SessionRegistry::close() {
    if (is_open()) {
        spdlog::info("[SessionRegistry] closed session {}", session_id_);
    }
    session_id_.clear();
    record_.reset();
}

// ---------------------------------------------------------------------------
// touch
// ---------------------------------------------------------------------------

void SessionRegistry::touch() {
    if (!is_open()) {
        throw std::logic_error("session registry is not open");
    }

    const int64_t now = clock_();
    SessionRecord next = record_ ? *record_ : SessionRecord{session_id_, now, now};
    next.last_saved_at = now;
    record_ = next;

    storage_.put_durable(StoreKind::sessions, EntityCodec::encode_session(next));
}

} // namespace hs
