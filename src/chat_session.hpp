#pragma once
#include "conversation_store.hpp"
#include "connection_registry.hpp"
#include "tool_call_loop.hpp"
#include "persona.hpp"
#include "keyed_mutex.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace spychat {

// ── Envelopes sent over a Transport ──

nlohmann::json system_envelope(const std::string& content, const std::string& connection_id = "");
nlohmann::json error_envelope(const std::string& content);

struct ChatRequest {
    std::string persona_id;
    std::string conversation_id;    // empty = the persona's active conversation
    std::string text;
    std::string origin_connection;  // empty for plain HTTP callers
};

struct ChatReply {
    std::string conversation_id;
    Persona persona;
    TurnOutcome outcome;
    nlohmann::json envelope;  // the "response" envelope that was delivered
};

// Runs one turn end to end: persist the user message, run the tool loop,
// persist its messages, deliver the response. Turns on one conversation are
// serialized for their whole duration; turns on different conversations
// run in parallel.
class ChatSession {
public:
    ChatSession(ConversationStore& store, const PersonaDirectory& personas,
                ConnectionRegistry& registry, ToolCallLoop& loop);

    Result<ChatReply> handle(const ChatRequest& request);

private:
    ConversationStore& store_;
    const PersonaDirectory& personas_;
    ConnectionRegistry& registry_;
    ToolCallLoop& loop_;
    KeyedMutex turn_locks_;

    Result<ConversationLog> open_conversation(const ChatRequest& request);
    void deliver(const ChatRequest& request, const std::string& conversation_id,
                 const nlohmann::json& envelope);
};

} // namespace spychat
