#include "history_codec.hpp"
#include "utils.hpp"
#include <iostream>

namespace spychat {

using json = nlohmann::json;

const char* encoding_name(HistoryEncoding e) {
    switch (e) {
    case HistoryEncoding::empty:         return "empty";
    case HistoryEncoding::canonical:     return "canonical";
    case HistoryEncoding::flat:          return "flat";
    case HistoryEncoding::parts:         return "parts";
    case HistoryEncoding::single_object: return "single_object";
    case HistoryEncoding::raw_text:      return "raw_text";
    }
    return "unknown";
}

// ── Shape sniffing ─────────────────────────────────────────────────────

static bool is_canonical_container(const json& j) {
    return j.is_object() && j.contains("format") && j["format"].is_string() &&
           j["format"].get<std::string>() == HistoryCodec::kFormatTag &&
           j.contains("messages") && j["messages"].is_array();
}

static bool looks_flat(const json& j) {
    return j.is_object() && j.contains("role") && j["role"].is_string();
}

static bool looks_parts(const json& j) {
    return j.is_object() && j.contains("kind") && j["kind"].is_string() &&
           j.contains("parts") && j["parts"].is_array();
}

// Legacy stores used a few role aliases besides the four canonical ones.
static std::optional<Role> legacy_role(const std::string& raw) {
    std::string r = to_lower(raw);
    if (auto role = parse_role(r)) return role;
    if (r == "model" || r == "ai" || r == "bot") return Role::assistant;
    if (r == "human") return Role::user;
    if (r == "function") return Role::tool;
    return std::nullopt;
}

static json parse_arguments(const json& a) {
    if (a.is_object()) return a;
    if (a.is_string()) {
        auto s = a.get<std::string>();
        if (trim(s).empty()) return json::object();
        auto parsed = json::parse(s, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) return parsed;
        return json{{"_raw", s}};
    }
    if (a.is_null()) return json::object();
    return json{{"_value", a}};
}

static Content legacy_content(const json& c) {
    if (c.is_null()) return std::string();
    if (c.is_string()) return c.get<std::string>();
    if (c.is_array()) {
        ContentParts parts;
        for (auto& p : c) {
            if (p.is_string()) {
                parts.push_back({{"type", "text"}, {"text", p.get<std::string>()}});
            } else if (p.is_object()) {
                parts.push_back(p);
            }
        }
        return parts;
    }
    // Objects and scalars (tool payloads stored as dicts) are kept as JSON text.
    return c.dump();
}

// ── Flat legacy: {"role", "content", ...} ──────────────────────────────

static std::optional<Message> decode_flat_entry(const json& e) {
    if (!looks_flat(e)) return std::nullopt;
    auto role = legacy_role(e["role"].get<std::string>());
    if (!role) return std::nullopt;

    Message m;
    m.role = *role;
    m.content = e.contains("content") ? legacy_content(e["content"]) : Content(std::string());

    if (e.contains("tool_call_id") && e["tool_call_id"].is_string()) {
        m.tool_call_id = e["tool_call_id"].get<std::string>();
    }
    if (m.role == Role::tool && m.tool_call_id.empty()) return std::nullopt;

    if (e.contains("tool_calls") && e["tool_calls"].is_array()) {
        for (auto& tc : e["tool_calls"]) {
            if (!tc.is_object()) continue;
            ToolCall t;
            t.id = tc.value("id", "");
            if (tc.contains("function") && tc["function"].is_object()) {
                // OpenAI wire shape: {"function": {"name", "arguments": "<json>"}}
                const auto& fn = tc["function"];
                t.name = fn.value("name", "");
                t.arguments = parse_arguments(fn.contains("arguments") ? fn["arguments"] : json());
            } else {
                t.name = tc.value("name", "");
                t.arguments = parse_arguments(tc.contains("arguments") ? tc["arguments"] : json());
            }
            if (t.name.empty()) continue;
            if (t.id.empty()) t.id = generate_tool_call_id();
            m.tool_calls.push_back(std::move(t));
        }
    }
    return m;
}

// ── Parts legacy: {"kind": "request|response", "parts": [...]} ─────────

static std::string part_text(const json& p) {
    if (!p.contains("content")) return "";
    const auto& c = p["content"];
    if (c.is_string()) return c.get<std::string>();
    if (c.is_null()) return "";
    return c.dump();
}

static std::vector<Message> decode_parts_entry(const json& e) {
    std::vector<Message> out;
    if (!looks_parts(e)) return out;
    std::string kind = e["kind"].get<std::string>();

    if (kind == "request") {
        for (auto& p : e["parts"]) {
            if (!p.is_object()) continue;
            std::string pk = p.value("part_kind", "");
            if (pk == "system-prompt") {
                out.push_back(Message::system(part_text(p)));
            } else if (pk == "user-prompt") {
                Message m;
                m.role = Role::user;
                m.content = p.contains("content") ? legacy_content(p["content"]) : Content(std::string());
                out.push_back(std::move(m));
            } else if (pk == "tool-return") {
                std::string id = p.value("tool_call_id", "");
                if (id.empty()) continue;
                out.push_back(Message::tool(id, part_text(p)));
            } else if (pk == "retry-prompt") {
                std::string id = p.value("tool_call_id", "");
                if (!id.empty() && p.contains("tool_name")) {
                    out.push_back(Message::tool(id, part_text(p)));
                } else {
                    out.push_back(Message::user(part_text(p)));
                }
            }
        }
        return out;
    }

    if (kind == "response") {
        Message m;
        m.role = Role::assistant;
        std::string text;
        for (auto& p : e["parts"]) {
            if (!p.is_object()) continue;
            std::string pk = p.value("part_kind", "");
            if (pk == "text") {
                if (!text.empty()) text += "\n";
                text += part_text(p);
            } else if (pk == "tool-call") {
                ToolCall t;
                t.id = p.value("tool_call_id", "");
                t.name = p.value("tool_name", "");
                t.arguments = parse_arguments(p.contains("args") ? p["args"] : json());
                if (t.name.empty()) continue;
                if (t.id.empty()) t.id = generate_tool_call_id();
                m.tool_calls.push_back(std::move(t));
            }
        }
        if (text.empty() && m.tool_calls.empty()) return out;
        m.content = text;
        out.push_back(std::move(m));
    }
    return out;
}

// Type mismatches inside an entry (a numeric id, say) surface as
// json::type_error; such an entry counts as malformed and is skipped.
static bool decode_legacy_entry(const json& e, std::vector<Message>& out) {
    try {
        if (looks_flat(e)) {
            auto m = decode_flat_entry(e);
            if (!m) return false;
            out.push_back(std::move(*m));
            return true;
        }
        if (looks_parts(e)) {
            auto msgs = decode_parts_entry(e);
            if (msgs.empty()) return false;
            for (auto& m : msgs) out.push_back(std::move(m));
            return true;
        }
    } catch (const json::exception& ex) {
        std::cerr << "[codec] Dropping legacy entry: " << ex.what() << "\n";
    }
    return false;
}

// ── Decoding ───────────────────────────────────────────────────────────

static DecodedHistory raw_fallback(const std::string& raw) {
    DecodedHistory d;
    d.encoding = HistoryEncoding::raw_text;
    d.messages.push_back(Message::assistant(raw));
    return d;
}

static DecodedHistory decode_json(const json& j, const std::string& raw, int depth) {
    DecodedHistory d;

    if (is_canonical_container(j)) {
        d.encoding = HistoryEncoding::canonical;
        for (auto& e : j["messages"]) {
            try {
                d.messages.push_back(Message::from_json(e));
            } catch (const std::exception&) {
                // Tolerate entries written by an older build of the canonical shape
                if (!decode_legacy_entry(e, d.messages)) d.skipped++;
            }
        }
        return d;
    }

    if (j.is_array()) {
        // Decide by the first recognisable entry; mixed lists still decode per entry.
        d.encoding = HistoryEncoding::flat;
        for (auto& e : j) {
            if (looks_parts(e)) { d.encoding = HistoryEncoding::parts; break; }
            if (looks_flat(e)) break;
        }
        for (auto& e : j) {
            if (!decode_legacy_entry(e, d.messages)) d.skipped++;
        }
        return d;
    }

    if (looks_flat(j) || looks_parts(j)) {
        if (decode_legacy_entry(j, d.messages)) {
            d.encoding = HistoryEncoding::single_object;
            return d;
        }
        return raw_fallback(raw);
    }

    // Double-encoded blob: a JSON string whose payload is itself a history.
    if (j.is_string() && depth == 0) {
        std::string inner = j.get<std::string>();
        auto parsed = json::parse(inner, nullptr, false);
        if (!parsed.is_discarded()) return decode_json(parsed, inner, depth + 1);
        return raw_fallback(inner);
    }

    return raw_fallback(raw);
}

DecodedHistory HistoryCodec::decode_detailed(const std::string& raw) {
    if (trim(raw).empty()) return DecodedHistory{};

    auto j = json::parse(raw, nullptr, false);
    if (j.is_discarded()) return raw_fallback(raw);

    auto d = decode_json(j, raw, 0);
    if (d.skipped > 0) {
        std::cerr << "[codec] Skipped " << d.skipped << " malformed "
                  << encoding_name(d.encoding) << " entries\n";
    }
    return d;
}

std::vector<Message> HistoryCodec::decode(const std::string& raw) {
    return decode_detailed(raw).messages;
}

std::string HistoryCodec::encode(const std::vector<Message>& messages) {
    json j;
    j["format"] = kFormatTag;
    j["version"] = kVersion;
    j["messages"] = json::array();
    for (auto& m : messages) j["messages"].push_back(m.to_json());
    // Raw-text fallbacks may carry invalid UTF-8; never let that make a log unwritable.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace spychat
