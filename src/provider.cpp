#include "provider.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <iostream>

namespace spychat {

// ── Error classification ───────────────────────────────────────────────

static bool text_contains_any(const std::string& text, std::initializer_list<const char*> patterns) {
    for (auto p : patterns) {
        if (text.find(p) != std::string::npos) return true;
    }
    return false;
}

ProviderErrorKind classify_provider_error(const std::string& error_text) {
    if (error_text.empty()) return ProviderErrorKind::unknown;
    std::string lower = to_lower(error_text);

    if (text_contains_any(lower, {"rate limit", "rate_limit", "too many requests", "429",
                                   "quota exceeded", "resource_exhausted", "usage limit"}))
        return ProviderErrorKind::rate_limit;

    if (text_contains_any(lower, {"overloaded", "overloaded_error", "503"}))
        return ProviderErrorKind::overloaded;

    if (text_contains_any(lower, {"context overflow", "context window", "prompt too large",
                                   "too long", "token limit", "maximum context",
                                   "exceeds the model", "input too large"}))
        return ProviderErrorKind::context_overflow;

    if (text_contains_any(lower, {"timeout", "timed out", "deadline exceeded"}))
        return ProviderErrorKind::timeout;

    if (text_contains_any(lower, {"connection error", "connection refused", "could not connect"}))
        return ProviderErrorKind::connection;

    if (text_contains_any(lower, {"401", "403", "unauthorized", "forbidden",
                                   "invalid api key", "invalid_api_key", "authentication"}))
        return ProviderErrorKind::auth;

    if (text_contains_any(lower, {"402", "payment required", "insufficient credits",
                                   "billing", "insufficient balance"}))
        return ProviderErrorKind::billing;

    return ProviderErrorKind::unknown;
}

ErrorKind to_error_kind(ProviderErrorKind kind) {
    switch (kind) {
    case ProviderErrorKind::timeout:
    case ProviderErrorKind::connection:
    case ProviderErrorKind::overloaded:
        return ErrorKind::upstream_unavailable;
    default:
        return ErrorKind::upstream_error;
    }
}

static UpstreamError upstream(const std::string& what) {
    return UpstreamError(to_error_kind(classify_provider_error(what)), what);
}

// ── URL handling ───────────────────────────────────────────────────────

static void parse_url(const std::string& url, std::string& scheme, std::string& host, int& port, std::string& path_prefix) {
    scheme = "http";
    host = "127.0.0.1";
    port = 80;
    path_prefix = "";

    size_t pos = 0;
    if (url.compare(0, 8, "https://") == 0) {
        scheme = "https"; pos = 8; port = 443;
    } else if (url.compare(0, 7, "http://") == 0) {
        scheme = "http"; pos = 7; port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        path_prefix = url.substr(slash);
        while (!path_prefix.empty() && path_prefix.back() == '/') path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host = host_port.substr(0, colon);
        port = std::atoi(host_port.substr(colon + 1).c_str());
        if (port <= 0) port = (scheme == "https") ? 443 : 80;
    } else {
        host = host_port;
    }
}

OpenAiProvider::OpenAiProvider(const ProviderConfig& cfg, int max_tokens, double temperature,
                               int connect_timeout, int read_timeout)
    : config_(cfg), max_tokens_(max_tokens), temperature_(temperature),
      connect_timeout_(connect_timeout), read_timeout_(read_timeout) {
    parse_url(config_.api_base, scheme_, host_, port_, path_prefix_);
    base_url_ = scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

// ── Inline tool call parsing (no regex) ────────────────────────────────

// Drops trailing commas before } or ] outside strings.
static std::string fix_json(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_string = false;
    bool escape = false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (escape) { out += c; escape = false; continue; }
        if (c == '\\' && in_string) { out += c; escape = true; continue; }
        if (c == '"') { in_string = !in_string; out += c; continue; }
        if (in_string) { out += c; continue; }
        if (c == ',') {
            size_t j = i + 1;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) j++;
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) continue;
        }
        out += c;
    }
    return out;
}

static nlohmann::json decode_arguments(const nlohmann::json& raw) {
    if (raw.is_object()) return raw;
    if (raw.is_string()) {
        auto parsed = nlohmann::json::parse(raw.get<std::string>(), nullptr, false);
        if (parsed.is_object()) return parsed;
    }
    return nlohmann::json::object();
}

static bool try_parse_tool_call(const nlohmann::json& j, ToolCall& tc) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) return false;
    tc.id = generate_tool_call_id();
    tc.name = j["name"].get<std::string>();
    if (tc.name.empty()) return false;
    if (j.contains("arguments")) tc.arguments = decode_arguments(j["arguments"]);
    else if (j.contains("parameters")) tc.arguments = decode_arguments(j["parameters"]);
    return true;
}

// Index of the brace closing the object that opens at pos.
static size_t find_json_object_end(const std::string& s, size_t pos) {
    if (pos >= s.size() || s[pos] != '{') return std::string::npos;
    int depth = 0;
    bool in_str = false;
    bool esc = false;
    for (size_t i = pos; i < s.size(); i++) {
        char c = s[i];
        if (esc) { esc = false; continue; }
        if (c == '\\' && in_str) { esc = true; continue; }
        if (c == '"') { in_str = !in_str; continue; }
        if (in_str) continue;
        if (c == '{') depth++;
        else if (c == '}') { depth--; if (depth == 0) return i; }
    }
    return std::string::npos;
}

static bool parse_object_at(const std::string& s, size_t brace, ToolCall& tc) {
    size_t end = find_json_object_end(s, brace);
    if (end == std::string::npos) return false;
    auto j = nlohmann::json::parse(fix_json(s.substr(brace, end - brace + 1)), nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[provider] Ignoring unparsable inline tool call\n";
        return false;
    }
    return try_parse_tool_call(j, tc);
}

static std::vector<ToolCall> parse_tagged_tool_calls(const std::string& text,
                                                     const std::string& open_tag,
                                                     const std::string& close_tag) {
    std::vector<ToolCall> calls;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t tag_start = text.find(open_tag, pos);
        if (tag_start == std::string::npos) break;
        size_t content_start = tag_start + open_tag.size();
        size_t tag_end = text.find(close_tag, content_start);
        if (tag_end == std::string::npos) break;

        std::string inner = text.substr(content_start, tag_end - content_start);
        size_t brace = inner.find('{');
        ToolCall tc;
        if (brace != std::string::npos && parse_object_at(inner, brace, tc)) calls.push_back(std::move(tc));
        pos = tag_end + close_tag.size();
    }
    return calls;
}

static std::vector<ToolCall> parse_markdown_json_blocks(const std::string& text) {
    std::vector<ToolCall> calls;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t fence_start = text.find("```", pos);
        if (fence_start == std::string::npos) break;
        size_t line_end = text.find('\n', fence_start);
        if (line_end == std::string::npos) break;

        std::string lang = trim(text.substr(fence_start + 3, line_end - fence_start - 3));
        size_t fence_end = text.find("\n```", line_end);
        if (fence_end == std::string::npos) { pos = line_end; continue; }

        std::string block = text.substr(line_end + 1, fence_end - line_end - 1);
        pos = fence_end + 4;
        if (!lang.empty() && lang != "json" && lang != "tool") continue;

        size_t brace = block.find('{');
        ToolCall tc;
        if (brace != std::string::npos && parse_object_at(block, brace, tc)) calls.push_back(std::move(tc));
    }
    return calls;
}

static void strip_tag(std::string& text, const std::string& open_tag, const std::string& close_tag) {
    for (;;) {
        size_t s = text.find(open_tag);
        if (s == std::string::npos) break;
        size_t e = text.find(close_tag, s);
        if (e == std::string::npos) break;
        text.erase(s, e + close_tag.size() - s);
    }
}

std::vector<ToolCall> parse_inline_tool_calls(std::string& text) {
    auto calls = parse_tagged_tool_calls(text, "<toolcall>", "</toolcall>");
    if (calls.empty()) calls = parse_tagged_tool_calls(text, "<tool_call>", "</tool_call>");
    if (calls.empty()) calls = parse_markdown_json_blocks(text);
    if (!calls.empty()) {
        strip_tag(text, "<toolcall>", "</toolcall>");
        strip_tag(text, "<tool_call>", "</tool_call>");
        text = trim(text);
    }
    return calls;
}

// ── Request ────────────────────────────────────────────────────────────

nlohmann::json OpenAiProvider::to_wire(const Message& m) {
    nlohmann::json j;
    j["role"] = role_name(m.role);
    if (m.has_parts()) {
        j["content"] = std::get<ContentParts>(m.content);
    } else {
        j["content"] = std::get<std::string>(m.content);
    }
    if (m.role == Role::tool) j["tool_call_id"] = m.tool_call_id;
    if (!m.tool_calls.empty()) {
        j["tool_calls"] = nlohmann::json::array();
        for (auto& tc : m.tool_calls) {
            j["tool_calls"].push_back({
                {"id", tc.id},
                {"type", "function"},
                {"function", {{"name", tc.name}, {"arguments", tc.arguments.dump()}}}
            });
        }
    }
    return j;
}

LlmReply OpenAiProvider::complete(const std::string& system_prompt,
                                  const std::vector<Message>& history,
                                  const nlohmann::json& tools_spec) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(connect_timeout_);
    cli.set_read_timeout(read_timeout_);

    nlohmann::json body;
    body["model"] = config_.model;
    body["max_tokens"] = max_tokens_;
    body["temperature"] = temperature_;

    auto& msgs = body["messages"];
    msgs = nlohmann::json::array();
    if (!system_prompt.empty()) msgs.push_back({{"role", "system"}, {"content", system_prompt}});
    for (auto& m : history) msgs.push_back(to_wire(m));

    if (tools_spec.is_array() && !tools_spec.empty()) {
        body["tools"] = tools_spec;
    }

    std::string path = path_prefix_ + "/chat/completions";
    std::string payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    auto res = cli.Post(path, headers, payload, "application/json");
    if (!res) {
        std::string what = "Provider request failed: " + httplib::to_string(res.error());
        std::cerr << "[provider] " << what << "\n";
        throw UpstreamError(ErrorKind::upstream_unavailable, what);
    }
    if (res->status != 200) {
        std::string what = "Provider returned status " + std::to_string(res->status) + ": " + res->body;
        std::cerr << "[provider] " << what << "\n";
        throw upstream(what);
    }

    LlmReply reply;
    try {
        auto j = nlohmann::json::parse(res->body);
        if (j.contains("choices") && !j["choices"].empty()) {
            auto& msg = j["choices"][0]["message"];
            reply.text = msg.contains("content") && msg["content"].is_string()
                         ? msg["content"].get<std::string>() : "";

            if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
                for (auto& tc : msg["tool_calls"]) {
                    ToolCall t;
                    t.id = tc.value("id", "");
                    if (t.id.empty()) t.id = generate_tool_call_id();
                    if (tc.contains("function")) {
                        t.name = tc["function"].value("name", "");
                        if (tc["function"].contains("arguments")) {
                            t.arguments = decode_arguments(tc["function"]["arguments"]);
                        }
                    }
                    if (!t.name.empty()) reply.tool_calls.push_back(std::move(t));
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw UpstreamError(ErrorKind::upstream_error,
                            std::string("Failed to parse provider response: ") + e.what());
    }

    if (reply.tool_calls.empty() && !reply.text.empty()) {
        reply.tool_calls = parse_inline_tool_calls(reply.text);
    }
    return reply;
}

} // namespace spychat
