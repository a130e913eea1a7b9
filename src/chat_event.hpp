#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace trelay {

constexpr const char* kChatEventName = "chat";

// Only complete snapshots are relayed today.
enum class ChatState {
    Final,
};

const char* chat_state_name(ChatState state);

struct ChatEventPayload {
    std::string run_id;
    std::string session_key;
    ChatState state = ChatState::Final;
};

// {"runId": ..., "sessionKey": ..., "state": "final"}
nlohmann::json to_json(const ChatEventPayload& payload);

// "transcript-<uuid>", or "transcript-<session id>-<uuid>" when the
// session id is known. Fresh on every call.
std::string make_transcript_run_id(const std::string& session_id = {});

} // namespace trelay
