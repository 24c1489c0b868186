#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace spychat {

struct ProviderConfig {
    std::string api_key;
    std::string api_base = "http://127.0.0.1:8000/v1";
    std::string model = "gpt-4.1-mini";
};

struct CacheConfig {
    int error_ttl_seconds = 0;      // 0 = cached errors never expire
    int wait_timeout_seconds = 30;  // how long a waiter blocks on an in-flight fetch
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 8000;
    int max_streams = 24;  // concurrent /ws/chat streams before 503
};

struct Config {
    std::string workspace = "~/.spychat";
    std::string database;       // empty = <workspace>/spychat.db
    std::string missions_dir;   // empty = <workspace>/missions

    ProviderConfig provider;
    int max_tokens = 1024;
    double temperature = 0.7;

    int max_tool_calls = 2;           // per turn, clamped to 1..3
    int turn_timeout_seconds = 180;
    int llm_connect_timeout = 30;
    int llm_read_timeout = 120;

    CacheConfig cache;
    GatewayConfig gateway;

    std::string workspace_path() const {
        return expand_path(workspace);
    }
    std::string database_path() const {
        return database.empty() ? workspace_path() + "/spychat.db" : expand_path(database);
    }
    std::string missions_path() const {
        return missions_dir.empty() ? workspace_path() + "/missions" : expand_path(missions_dir);
    }

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace spychat
