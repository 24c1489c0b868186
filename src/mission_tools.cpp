#include "mission_tools.hpp"
#include "utils.hpp"
#include <set>
#include <iostream>

namespace spychat {

// ── File backend ──

bool is_valid_mission_id(const std::string& id) {
    if (id.empty() || id.size() > 64) return false;
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') return false;
    }
    return true;
}

Result<std::string> FileMissionBackend::fetch_mission_context(const std::string& mission_id) {
    if (!is_valid_mission_id(mission_id)) {
        return Error{ErrorKind::invalid_request, "Invalid mission ID: " + mission_id};
    }
    fs::path path = fs::path(expand_path(dir_)) / (mission_id + ".txt");
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return not_found("No mission found with ID: " + mission_id);
    }
    std::ifstream f(path);
    if (!f) {
        return Error{ErrorKind::upstream_error, "Cannot read mission file: " + path.string()};
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// ── Reference extraction (hand-rolled tokenizer, no regex) ──

static bool is_id_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

// Words that commonly follow "mission" without naming one.
static const std::set<std::string>& filler_words() {
    static const std::set<std::string> words = {
        "a", "an", "the", "is", "was", "are", "of", "for", "to", "and", "or", "in", "on",
        "about", "with", "that", "this", "it", "you", "me", "my", "your",
        "details", "detail", "status", "briefing", "brief", "context", "info",
        "information", "report", "file", "files", "data", "objective", "objectives",
        "name", "names", "number", "please", "now", "today",
        // verbs and adverbs that describe a mission rather than name one
        "go", "goes", "went", "gone", "be", "been", "were", "did", "do", "does",
        "has", "had", "have", "will", "would", "could", "should", "can", "must",
        "yesterday", "tomorrow", "tonight", "again", "last", "next", "first", "before",
        "after", "like", "so", "too", "yet", "still", "then", "there", "here", "over",
        "start", "end", "fail", "succeed", "work", "begin", "began", "begun",
        "going", "planning", "started", "ended", "failed", "succeeded", "worked",
        "completed", "accomplished", "planned", "aborted", "finished",
        "finally", "really", "actually", "recently", "ultimately", "successfully"
    };
    return words;
}

static std::string read_token(const std::string& text, size_t& i) {
    size_t start = i;
    while (i < text.size() && is_id_char(text[i])) i++;
    std::string tok = text.substr(start, i - start);
    while (!tok.empty() && (tok.back() == '-' || tok.back() == '_')) tok.pop_back();
    return tok;
}

static void skip_separators(const std::string& text, size_t& i) {
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t' || text[i] == '#' || text[i] == ':')) i++;
}

std::vector<std::string> extract_mission_ids(const std::string& text) {
    std::vector<std::string> ids;
    auto add = [&ids](const std::string& id) {
        if (!is_valid_mission_id(id)) return;
        for (auto& existing : ids) if (existing == id) return;
        ids.push_back(id);
    };

    size_t i = 0;
    while (i < text.size()) {
        if (!is_id_char(text[i])) { i++; continue; }
        std::string tok = read_token(text, i);
        std::string lower = to_lower(tok);

        // mission_123 / mission-7 name themselves
        if (lower.size() > 8 && lower.compare(0, 7, "mission") == 0 && (lower[7] == '_' || lower[7] == '-')) {
            add(tok);
            continue;
        }
        if (lower != "mission") continue;

        size_t j = i;
        skip_separators(text, j);
        // "mission #42" and "mission id: paris" mark the next token as an id.
        bool marked = text.find('#', i) < j;
        std::string next = read_token(text, j);
        std::string next_lower = to_lower(next);
        if (next_lower == "id" || next_lower == "ids") {
            marked = true;
            skip_separators(text, j);
            next = read_token(text, j);
            next_lower = to_lower(next);
        }
        if (next.empty()) continue;
        if (!marked && filler_words().count(next_lower)) continue;
        add(next);
        i = j;
    }
    return ids;
}

// Whole-word match, so "permission" or "transmission" do not count.
bool mentions_mission(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        if (!is_id_char(text[i])) { i++; continue; }
        std::string lower = to_lower(read_token(text, i));
        if (lower == "mission" || lower == "missions") return true;
        if (lower.size() > 8 && lower.compare(0, 7, "mission") == 0 && (lower[7] == '_' || lower[7] == '-')) {
            return true;
        }
    }
    return false;
}

// ── get_mission_context ──

void register_mission_tools(ToolRegistry& reg, MissionBackend& backend) {
    ToolDef def;
    def.name = "get_mission_context";
    def.description = "Retrieve the mission file for a specific mission ID. "
                      "Only use when the user explicitly gives a mission ID, "
                      "e.g. \"tell me about mission paris\" or \"mission_123\".";
    def.parameters = nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "mission_id": {"type": "string", "description": "The ID of the mission, exactly as the user wrote it"}
        },
        "required": ["mission_id"]
    })JSON");

    def.func = [&backend](const nlohmann::json& args) -> ToolResult {
        std::string id;
        if (args.contains("mission_id") && args["mission_id"].is_string()) {
            id = args["mission_id"].get<std::string>();
        }
        if (id.empty()) {
            return ToolResult{"", "No mission ID provided. Please specify a mission ID.", ToolStatus::error};
        }
        auto res = backend.fetch_mission_context(id);
        if (is_error(res)) {
            std::cerr << "[mission] " << get_error(res).message << "\n";
            return ToolResult{"", get_error(res).message, ToolStatus::error};
        }
        return ToolResult{"", get_value(res), ToolStatus::success};
    };

    def.references = [](const std::string& text) {
        std::vector<nlohmann::json> refs;
        for (auto& id : extract_mission_ids(text)) refs.push_back({{"mission_id", id}});
        return refs;
    };
    def.mentions_subject = mentions_mission;
    def.clarification = "Which mission are you asking about? Give me the mission ID and I'll pull the file.";

    reg.register_tool(std::move(def));
}

} // namespace spychat
