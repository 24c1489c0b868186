#pragma once
#include "message.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace spychat {

struct LlmReply {
    std::string text;
    std::vector<ToolCall> tool_calls;
    bool has_tool_calls() const { return !tool_calls.empty(); }
};

// Chat completion seam. Implementations throw UpstreamError when the model
// is unreachable or answers with a failure.
class LlmClient {
public:
    virtual ~LlmClient() = default;
    virtual LlmReply complete(const std::string& system_prompt,
                              const std::vector<Message>& history,
                              const nlohmann::json& tools_spec) = 0;
};

} // namespace spychat
