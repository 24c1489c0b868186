#include "tool_call_loop.hpp"
#include <algorithm>
#include <iostream>

namespace spychat {

ToolCallLoop::ToolCallLoop(LlmClient& llm, const ToolRegistry& tools, MissionContextCache& cache,
                           LoopPolicy policy)
    : llm_(llm), tools_(tools), cache_(cache), policy_(policy) {
    policy_.max_tool_calls = std::clamp(policy_.max_tool_calls, 1, 3);
}

// nlohmann objects iterate keys in sorted order, so dump() is canonical.
std::string ToolCallLoop::cache_key(const std::string& tool, const nlohmann::json& args) {
    return tool + ":" + args.dump();
}

ToolResult ToolCallLoop::invoke(const ToolCall& call) {
    auto key = cache_key(call.name, call.arguments);
    auto result = cache_.get(key, [this, &call](const std::string&) {
        return tools_.execute(call.name, call.arguments);
    });
    result.invocation_id = call.id;
    return result;
}

void ToolCallLoop::fail(TurnOutcome& out, ErrorKind kind, std::string text) {
    out.state = TurnState::failed;
    out.error_kind = kind;
    out.response_text = std::move(text);
    out.new_messages.push_back(Message::assistant(out.response_text));
}

TurnOutcome ToolCallLoop::run(const TurnInput& input) {
    TurnOutcome out;
    auto deadline = std::chrono::steady_clock::now() + policy_.turn_timeout;

    // Ambiguous: mentions a tool's subject without naming what to look up.
    auto clarification = tools_.clarification_for(input.user_text);
    if (!clarification.empty()) {
        out.response_text = clarification;
        out.new_messages.push_back(Message::assistant(clarification));
        return out;
    }

    // Tools are only offered when the user named something a tool can fetch.
    nlohmann::json offered = nlohmann::json::array();
    nlohmann::json spec = tools_.tools_spec();
    for (auto& entry : spec) {
        auto* def = tools_.find(entry["function"]["name"].get<std::string>());
        if (def && def->references && !def->references(input.user_text).empty()) offered.push_back(entry);
    }

    std::vector<Message> working = input.history;
    int invocations = 0;
    const int max_rounds = policy_.max_tool_calls + 1;

    for (int round = 0; round < max_rounds; round++) {
        if (std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "[loop] Turn deadline exceeded after " << round << " rounds\n";
            fail(out, ErrorKind::upstream_unavailable,
                 "I encountered an error: the request took too long. Try again in a moment.");
            return out;
        }

        LlmReply reply;
        try {
            reply = llm_.complete(input.system_prompt, working, offered);
        } catch (const UpstreamError& e) {
            std::cerr << "[loop] LLM call failed (" << error_kind_name(e.kind()) << "): " << e.what() << "\n";
            fail(out, e.kind(), std::string("I encountered an error: ") + e.what());
            return out;
        }

        if (!reply.has_tool_calls()) {
            out.response_text = reply.text.empty() ? "I have nothing further to report." : reply.text;
            out.new_messages.push_back(Message::assistant(out.response_text));
            return out;
        }

        Message call_msg = Message::assistant(reply.text);
        call_msg.tool_calls = reply.tool_calls;
        working.push_back(call_msg);
        out.new_messages.push_back(call_msg);

        bool exceeded = false;
        for (auto& call : reply.tool_calls) {
            Message answer;
            if (exceeded || invocations >= policy_.max_tool_calls) {
                exceeded = true;
                answer = Message::tool(call.id, "Error: tool call limit reached for this turn");
            } else if (!tools_.has(call.name)) {
                std::cerr << "[loop] Rejected unknown tool " << call.name << "\n";
                answer = Message::tool(call.id, "Error: unknown tool " + call.name);
            } else if (!tools_.referenced(call.name, call.arguments, input.user_text)) {
                std::cerr << "[loop] Rejected " << call.name << " " << call.arguments.dump()
                          << ": arguments not named by the user\n";
                answer = Message::tool(call.id,
                    "Error: the user did not give these arguments; ask them instead of guessing");
            } else {
                invocations++;
                auto result = invoke(call);
                out.tool_calls_made.push_back(ToolInvocation{call.id, call.name, call.arguments});
                answer = Message::tool(call.id, result.ok() ? result.payload : "Error: " + result.payload);
            }
            working.push_back(answer);
            out.new_messages.push_back(answer);
        }

        if (exceeded) break;
    }

    std::cerr << "[loop] Tool call bound reached (" << invocations << " invocations)\n";
    fail(out, ErrorKind::tool_bound_exceeded,
         "I'm sorry, I can only check " + std::to_string(policy_.max_tool_calls) +
         " mission file(s) per question. Ask me about fewer missions at once.");
    return out;
}

} // namespace spychat
