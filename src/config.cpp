#include "config.hpp"
#include <fstream>
#include <iostream>
#include <algorithm>

namespace spychat {

Config Config::make_default() {
    return Config{};
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["workspace"] = workspace;
    if (!database.empty()) j["database"] = database;
    if (!missions_dir.empty()) j["missions_dir"] = missions_dir;

    j["provider"] = {{"api_base", provider.api_base}, {"model", provider.model}};
    if (!provider.api_key.empty()) j["provider"]["api_key"] = provider.api_key;

    j["max_tokens"] = max_tokens;
    j["temperature"] = temperature;
    j["max_tool_calls"] = max_tool_calls;
    j["turn_timeout_seconds"] = turn_timeout_seconds;
    j["llm_connect_timeout"] = llm_connect_timeout;
    j["llm_read_timeout"] = llm_read_timeout;

    j["cache"] = {
        {"error_ttl_seconds", cache.error_ttl_seconds},
        {"wait_timeout_seconds", cache.wait_timeout_seconds}
    };
    j["gateway"] = {{"host", gateway.host}, {"port", gateway.port},
                      {"max_streams", gateway.max_streams}};
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    c.workspace = j.value("workspace", c.workspace);
    c.database = j.value("database", c.database);
    c.missions_dir = j.value("missions_dir", c.missions_dir);

    if (j.contains("provider") && j["provider"].is_object()) {
        auto& p = j["provider"];
        c.provider.api_key = p.value("api_key", c.provider.api_key);
        c.provider.api_base = p.value("api_base", c.provider.api_base);
        c.provider.model = p.value("model", c.provider.model);
    }
    // Flat "model" key is accepted as a shorthand
    c.provider.model = j.value("model", c.provider.model);

    c.max_tokens = j.value("max_tokens", c.max_tokens);
    c.temperature = j.value("temperature", c.temperature);
    c.max_tool_calls = j.value("max_tool_calls", c.max_tool_calls);
    c.turn_timeout_seconds = j.value("turn_timeout_seconds", c.turn_timeout_seconds);
    c.llm_connect_timeout = j.value("llm_connect_timeout", c.llm_connect_timeout);
    c.llm_read_timeout = j.value("llm_read_timeout", c.llm_read_timeout);

    if (c.max_tool_calls < 1 || c.max_tool_calls > 3) {
        std::cerr << "[config] Warning: max_tool_calls " << c.max_tool_calls << " out of range, clamping to 1..3\n";
        c.max_tool_calls = std::clamp(c.max_tool_calls, 1, 3);
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& cc = j["cache"];
        c.cache.error_ttl_seconds = cc.value("error_ttl_seconds", c.cache.error_ttl_seconds);
        c.cache.wait_timeout_seconds = cc.value("wait_timeout_seconds", c.cache.wait_timeout_seconds);
    }

    if (j.contains("gateway") && j["gateway"].is_object()) {
        auto& g = j["gateway"];
        c.gateway.host = g.value("host", c.gateway.host);
        c.gateway.port = g.value("port", c.gateway.port);
        c.gateway.max_streams = g.value("max_streams", c.gateway.max_streams);
    }

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f) throw std::runtime_error("Cannot write config: " + path);
    f << to_json().dump(2) << std::endl;
}

} // namespace spychat
