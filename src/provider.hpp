#pragma once
#include "config.hpp"
#include "llm_client.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

namespace spychat {

enum class ProviderErrorKind {
    unknown,
    rate_limit,
    timeout,
    overloaded,
    context_overflow,
    auth,
    billing,
    connection
};

ProviderErrorKind classify_provider_error(const std::string& error_text);

// Timeouts and connection failures mean the model was never reached.
ErrorKind to_error_kind(ProviderErrorKind kind);

// Tool calls written inline by local models that lack native tool calling:
// <tool_call>{...}</tool_call>, <toolcall>{...}</toolcall> or a ```json block.
// Strips the tags from text when any are found.
std::vector<ToolCall> parse_inline_tool_calls(std::string& text);

// OpenAI-compatible /chat/completions client.
class OpenAiProvider : public LlmClient {
public:
    OpenAiProvider(const ProviderConfig& cfg, int max_tokens, double temperature,
                   int connect_timeout, int read_timeout);

    LlmReply complete(const std::string& system_prompt,
                      const std::vector<Message>& history,
                      const nlohmann::json& tools_spec) override;

    static nlohmann::json to_wire(const Message& m);

private:
    ProviderConfig config_;
    int max_tokens_;
    double temperature_;
    int connect_timeout_;
    int read_timeout_;
    // Cached URL components (parsed once in constructor)
    std::string scheme_;
    std::string host_;
    int port_;
    std::string path_prefix_;
    std::string base_url_;  // scheme://host:port
};

} // namespace spychat
