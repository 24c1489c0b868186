#pragma once
#include "mission_cache.hpp"
#include <string>
#include <map>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace spychat {

using ToolFunction = std::function<ToolResult(const nlohmann::json&)>;

// Argument objects a user message explicitly names, e.g. [{"mission_id":"atlas-9"}].
using ReferenceExtractor = std::function<std::vector<nlohmann::json>(const std::string&)>;
using SubjectDetector = std::function<bool(const std::string&)>;

struct ToolDef {
    std::string name;
    std::string description;
    nlohmann::json parameters;
    ToolFunction func;

    // Invocation policy. A call is allowed only when its arguments appear in
    // references(user_text). Messages about the subject with no reference get
    // the clarification text instead of a call.
    ReferenceExtractor references;
    SubjectDetector mentions_subject;
    std::string clarification;
};

class ToolRegistry {
public:
    void register_tool(ToolDef def) {
        tools_[def.name] = std::move(def);
        rebuild_spec();
    }

    bool has(const std::string& name) const {
        return tools_.count(name) > 0;
    }

    const ToolDef* find(const std::string& name) const {
        auto it = tools_.find(name);
        return it == tools_.end() ? nullptr : &it->second;
    }

    ToolResult execute(const std::string& name, const nlohmann::json& args) const {
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            throw std::runtime_error("Unknown tool: " + name);
        }
        return it->second.func(args);
    }

    // Whether the user's text references exactly these arguments.
    bool referenced(const std::string& name, const nlohmann::json& args, const std::string& user_text) const {
        auto* def = find(name);
        if (!def) return false;
        if (!def->references) return true;
        for (auto& ref : def->references(user_text)) {
            if (ref == args) return true;
        }
        return false;
    }

    // Clarifying question for the first tool whose subject the text mentions
    // without giving a usable reference. Empty when nothing is ambiguous.
    std::string clarification_for(const std::string& user_text) const {
        for (auto& [name, def] : tools_) {
            if (!def.mentions_subject || !def.mentions_subject(user_text)) continue;
            if (def.references && !def.references(user_text).empty()) continue;
            return def.clarification;
        }
        return "";
    }

    // Built at registration so concurrent turns only ever read it.
    const nlohmann::json& tools_spec() const {
        return spec_;
    }

    std::vector<std::string> tool_names() const {
        std::vector<std::string> names;
        for (auto& [n, _] : tools_) names.push_back(n);
        return names;
    }

private:
    std::map<std::string, ToolDef> tools_;
    nlohmann::json spec_ = nlohmann::json::array();

    void rebuild_spec() {
        spec_ = nlohmann::json::array();
        for (auto& [name, def] : tools_) {
            spec_.push_back({
                {"type", "function"},
                {"function", {
                    {"name", def.name},
                    {"description", def.description},
                    {"parameters", def.parameters}
                }}
            });
        }
    }
};

} // namespace spychat
