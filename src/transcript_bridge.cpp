#include "transcript_bridge.hpp"
#include "broadcast.hpp"
#include "chat_event.hpp"
#include "log.hpp"
#include "session_store.hpp"
#include "util.hpp"
#include <utility>

namespace trelay {

TranscriptBridge::TranscriptBridge(TranscriptEvents& events,
                                   SessionStore& store,
                                   Broadcaster& sink,
                                   Logger* log,
                                   BridgeOptions options,
                                   HeaderReader reader)
    : events_(events),
      store_(store),
      sink_(sink),
      log_(log),
      options_(std::move(options)),
      reader_(std::move(reader)),
      session_key_by_file_(options_.cache_ttl_ms, options_.cache_max_entries, options_.clock),
      session_id_by_file_(options_.cache_ttl_ms, options_.cache_max_entries, options_.clock),
      session_key_by_id_(options_.cache_ttl_ms, options_.cache_max_entries, options_.clock) {
    if (!reader_) reader_ = read_session_id_from_transcript;
}

TranscriptBridge::~TranscriptBridge() {
    detach();
}

void TranscriptBridge::attach() {
    if (unsubscribe_) return;
    unsubscribe_ = events_.on_update([this](const TranscriptUpdate& update) {
        on_update(update);
    });
}

void TranscriptBridge::detach() {
    if (!unsubscribe_) return;
    Unsubscribe unsubscribe = std::move(unsubscribe_);
    unsubscribe_ = nullptr;
    unsubscribe();
}

void TranscriptBridge::on_update(const TranscriptUpdate& update) {
    std::string session_file = trim(update.session_file);
    if (session_file.empty()) return;

    try {
        handle_update(session_file);
    } catch (const std::exception& e) {
        if (log_) log_->warn("failed to handle transcript update (" + session_file +
                             "): " + e.what());
    } catch (...) {
        if (log_) log_->warn("failed to handle transcript update (" + session_file + ")");
    }
}

BridgeOutcome TranscriptBridge::handle_update(const std::string& session_file) {
    if (auto cached_key = session_key_by_file_.get(session_file)) {
        emit(*cached_key, {});
        return BridgeOutcome::Emitted;
    }

    std::string session_id;
    if (auto cached_id = session_id_by_file_.get(session_file)) {
        session_id = *cached_id;
    } else {
        auto read_id = reader_(session_file, options_.header_read_bytes);
        // No session record yet, or the file is mid-write: wait for the next update.
        if (!read_id) return BridgeOutcome::Ignored;
        session_id = *read_id;
        session_id_by_file_.set(session_file, session_id);
    }

    std::string session_key;
    if (auto cached_key = session_key_by_id_.get(session_id)) {
        session_key = *cached_key;
    } else {
        auto resolved = resolve_session_key(store_.load(), session_id);
        if (!resolved) {
            if (log_) log_->warn("transcript update ignored; session key not found (" +
                                 session_id + ")");
            return BridgeOutcome::Ignored;
        }
        session_key = *resolved;
        session_key_by_id_.set(session_id, session_key);
    }

    session_key_by_file_.set(session_file, session_key);
    emit(session_key, session_id);
    return BridgeOutcome::Emitted;
}

void TranscriptBridge::emit(const std::string& session_key, const std::string& session_id) {
    ChatEventPayload payload;
    payload.run_id = make_transcript_run_id(session_id);
    payload.session_key = session_key;
    payload.state = ChatState::Final;

    BroadcastOptions options;
    options.drop_if_slow = true;
    sink_.broadcast(kChatEventName, to_json(payload), options);
}

} // namespace trelay
