#pragma once
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace spychat {

enum class Role { system, user, assistant, tool };

inline const char* role_name(Role r) {
    switch (r) {
    case Role::system:    return "system";
    case Role::user:      return "user";
    case Role::assistant: return "assistant";
    case Role::tool:      return "tool";
    }
    return "assistant";
}

inline std::optional<Role> parse_role(const std::string& s) {
    if (s == "system") return Role::system;
    if (s == "user") return Role::user;
    if (s == "assistant") return Role::assistant;
    if (s == "tool") return Role::tool;
    return std::nullopt;
}

struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();

    bool operator==(const ToolCall& o) const {
        return id == o.id && name == o.name && arguments == o.arguments;
    }
    bool operator!=(const ToolCall& o) const { return !(*this == o); }
};

// A content part is an arbitrary JSON object; text parts are
// {"type": "text", "text": "..."}.
using ContentParts = std::vector<nlohmann::json>;
using Content = std::variant<std::string, ContentParts>;

struct Message {
    Role role = Role::user;
    Content content = std::string();
    std::string tool_call_id;          // required for Role::tool
    std::vector<ToolCall> tool_calls;  // Role::assistant only

    static Message system(std::string text) { return Message{Role::system, std::move(text), {}, {}}; }
    static Message user(std::string text) { return Message{Role::user, std::move(text), {}, {}}; }
    static Message assistant(std::string text) { return Message{Role::assistant, std::move(text), {}, {}}; }
    static Message tool(std::string call_id, std::string text) {
        return Message{Role::tool, std::move(text), std::move(call_id), {}};
    }

    bool has_parts() const { return std::holds_alternative<ContentParts>(content); }

    // Flattened text view: text parts joined by newlines, other parts skipped.
    std::string text() const {
        if (auto* s = std::get_if<std::string>(&content)) return *s;
        std::string out;
        for (auto& part : std::get<ContentParts>(content)) {
            std::string piece;
            if (part.is_string()) {
                piece = part.get<std::string>();
            } else if (part.is_object() && part.contains("text") && part["text"].is_string()) {
                piece = part["text"].get<std::string>();
            } else {
                continue;
            }
            if (!out.empty()) out += "\n";
            out += piece;
        }
        return out;
    }

    bool operator==(const Message& o) const {
        return role == o.role && content == o.content &&
               tool_call_id == o.tool_call_id && tool_calls == o.tool_calls;
    }
    bool operator!=(const Message& o) const { return !(*this == o); }

    // Canonical per-message shape used by HistoryCodec.
    nlohmann::json to_json() const {
        nlohmann::json j;
        j["role"] = role_name(role);
        if (auto* s = std::get_if<std::string>(&content)) {
            j["content"] = *s;
        } else {
            j["content"] = nlohmann::json::array();
            for (auto& part : std::get<ContentParts>(content)) j["content"].push_back(part);
        }
        if (!tool_call_id.empty()) j["tool_call_id"] = tool_call_id;
        if (!tool_calls.empty()) {
            auto& arr = j["tool_calls"];
            arr = nlohmann::json::array();
            for (auto& tc : tool_calls) {
                arr.push_back({{"id", tc.id}, {"name", tc.name}, {"arguments", tc.arguments}});
            }
        }
        return j;
    }

    // Strict inverse of to_json(); throws std::invalid_argument on any
    // deviation so the codec can fall back to legacy sniffing.
    static Message from_json(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("role") || !j["role"].is_string()) {
            throw std::invalid_argument("message without role");
        }
        auto role = parse_role(j["role"].get<std::string>());
        if (!role) throw std::invalid_argument("unknown role");

        Message m;
        m.role = *role;
        if (!j.contains("content")) throw std::invalid_argument("message without content");
        const auto& c = j["content"];
        if (c.is_string()) {
            m.content = c.get<std::string>();
        } else if (c.is_array()) {
            ContentParts parts;
            for (auto& p : c) parts.push_back(p);
            m.content = std::move(parts);
        } else {
            throw std::invalid_argument("content must be string or array");
        }

        if (j.contains("tool_call_id")) {
            if (!j["tool_call_id"].is_string()) throw std::invalid_argument("bad tool_call_id");
            m.tool_call_id = j["tool_call_id"].get<std::string>();
        }
        if (m.role == Role::tool && m.tool_call_id.empty()) {
            throw std::invalid_argument("tool message without tool_call_id");
        }

        if (j.contains("tool_calls")) {
            if (!j["tool_calls"].is_array()) throw std::invalid_argument("bad tool_calls");
            for (auto& tc : j["tool_calls"]) {
                if (!tc.is_object() || !tc.contains("id") || !tc.contains("name")) {
                    throw std::invalid_argument("bad tool call entry");
                }
                ToolCall t;
                t.id = tc["id"].get<std::string>();
                t.name = tc["name"].get<std::string>();
                t.arguments = tc.value("arguments", nlohmann::json::object());
                m.tool_calls.push_back(std::move(t));
            }
        }
        return m;
    }
};

} // namespace spychat
