#pragma once
#include "message.hpp"
#include "errors.hpp"
#include "llm_client.hpp"
#include "tool_registry.hpp"
#include "mission_cache.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace spychat {

struct LoopPolicy {
    int max_tool_calls = 2;
    std::chrono::seconds turn_timeout{180};
};

struct ToolInvocation {
    std::string id;
    std::string name;
    nlohmann::json arguments;
};

enum class TurnState { done, failed };

struct TurnInput {
    std::string system_prompt;
    std::vector<Message> history;  // ends with the user message of this turn
    std::string user_text;
};

struct TurnOutcome {
    TurnState state = TurnState::done;
    std::string response_text;
    std::vector<ToolInvocation> tool_calls_made;
    // Assistant and tool messages produced by the turn, in order.
    std::vector<Message> new_messages;
    std::optional<ErrorKind> error_kind;
};

// One agent turn: ask the model, run the tool calls the user's message
// justifies through the cache, repeat until the model answers in text.
// Never throws for upstream or tool failures; the outcome always carries
// response text.
class ToolCallLoop {
public:
    ToolCallLoop(LlmClient& llm, const ToolRegistry& tools, MissionContextCache& cache,
                  LoopPolicy policy = {});

    TurnOutcome run(const TurnInput& input);

    static std::string cache_key(const std::string& tool, const nlohmann::json& args);

    const LoopPolicy& policy() const { return policy_; }

private:
    LlmClient& llm_;
    const ToolRegistry& tools_;
    MissionContextCache& cache_;
    LoopPolicy policy_;

    ToolResult invoke(const ToolCall& call);
    void fail(TurnOutcome& out, ErrorKind kind, std::string text);
};

} // namespace spychat
