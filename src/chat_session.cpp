#include "chat_session.hpp"
#include "utils.hpp"
#include <iostream>

namespace spychat {

nlohmann::json system_envelope(const std::string& content, const std::string& connection_id) {
    nlohmann::json j = {{"type", "system"}, {"content", content}};
    if (!connection_id.empty()) j["connection_id"] = connection_id;
    return j;
}

nlohmann::json error_envelope(const std::string& content) {
    return {{"type", "error"}, {"content", content}};
}

ChatSession::ChatSession(ConversationStore& store, const PersonaDirectory& personas,
                         ConnectionRegistry& registry, ToolCallLoop& loop)
    : store_(store), personas_(personas), registry_(registry), loop_(loop) {}

Result<ConversationLog> ChatSession::open_conversation(const ChatRequest& request) {
    if (request.conversation_id.empty()) {
        return store_.get_or_create_for_owner(request.persona_id);
    }
    auto log = store_.get(request.conversation_id);
    if (is_error(log)) return log;
    if (get_value(log).owner_id != request.persona_id) {
        return Error{ErrorKind::invalid_request,
                     "Conversation " + request.conversation_id + " does not belong to spy " + request.persona_id};
    }
    return log;
}

void ChatSession::deliver(const ChatRequest& request, const std::string& conversation_id,
                          const nlohmann::json& envelope) {
    registry_.broadcast_to_conversation(conversation_id, envelope);

    // The origin already got it through the broadcast when it is bound to
    // this conversation.
    if (request.origin_connection.empty()) return;
    auto bound = registry_.conversation_of(request.origin_connection);
    if (!bound || *bound != conversation_id) {
        registry_.send_to(request.origin_connection, envelope);
    }
}

Result<ChatReply> ChatSession::handle(const ChatRequest& request) {
    if (trim(request.text).empty()) {
        return Error{ErrorKind::invalid_request, "Message must not be empty"};
    }

    auto persona = personas_.resolve(request.persona_id);
    if (is_error(persona)) return get_error(persona);

    auto opened = open_conversation(request);
    if (is_error(opened)) return get_error(opened);
    std::string conversation_id = get_value(opened).id;

    auto turn = turn_locks_.lock(conversation_id);

    auto appended = store_.append(conversation_id, {Message::user(request.text)});
    if (is_error(appended)) return get_error(appended);

    auto log = store_.get(conversation_id);
    if (is_error(log)) return get_error(log);

    TurnInput input;
    input.system_prompt = build_system_prompt(get_value(persona));
    input.history = get_value(log).messages;
    input.user_text = request.text;

    ChatReply reply;
    reply.conversation_id = conversation_id;
    reply.persona = get_value(persona);
    reply.outcome = loop_.run(input);

    if (reply.outcome.state == TurnState::failed) {
        std::cerr << "[session] Turn on " << conversation_id << " failed ("
                  << error_kind_name(*reply.outcome.error_kind) << ")\n";
    }

    // Persisted even if the requesting client went away mid-turn.
    auto saved = store_.append(conversation_id, reply.outcome.new_messages);
    if (is_error(saved)) {
        std::cerr << "[session] Could not persist reply for " << conversation_id
                  << ": " << get_error(saved).message << "\n";
    }

    nlohmann::json tool_calls = nlohmann::json::array();
    for (auto& inv : reply.outcome.tool_calls_made) {
        tool_calls.push_back({{"id", inv.id}, {"name", inv.name}, {"arguments", inv.arguments}});
    }
    reply.envelope = {
        {"type", "response"},
        {"spy_id", reply.persona.id},
        {"spy_name", reply.persona.display_name()},
        {"message", request.text},
        {"response", reply.outcome.response_text},
        {"conversation_id", conversation_id},
        {"status", reply.outcome.state == TurnState::done ? "done" : "failed"},
        {"tool_calls", tool_calls}
    };
    deliver(request, conversation_id, reply.envelope);
    return reply;
}

} // namespace spychat
