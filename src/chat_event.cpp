#include "chat_event.hpp"
#include "util.hpp"

namespace trelay {

const char* chat_state_name(ChatState state) {
    switch (state) {
        case ChatState::Final: return "final";
    }
    return "final";
}

nlohmann::json to_json(const ChatEventPayload& payload) {
    return {
        {"runId", payload.run_id},
        {"sessionKey", payload.session_key},
        {"state", chat_state_name(payload.state)}
    };
}

std::string make_transcript_run_id(const std::string& session_id) {
    if (session_id.empty()) return "transcript-" + generate_uuid();
    return "transcript-" + session_id + "-" + generate_uuid();
}

} // namespace trelay
