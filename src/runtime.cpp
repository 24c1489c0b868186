#include "runtime.hpp"
#include <algorithm>
#include <iostream>

namespace spychat {

CacheOptions cache_options(const Config& cfg) {
    CacheOptions o;
    o.error_ttl = std::chrono::seconds(std::max(0, cfg.cache.error_ttl_seconds));
    o.wait_timeout = std::chrono::seconds(std::max(1, cfg.cache.wait_timeout_seconds));
    return o;
}

LoopPolicy loop_policy(const Config& cfg) {
    LoopPolicy p;
    p.max_tool_calls = cfg.max_tool_calls;
    p.turn_timeout = std::chrono::seconds(std::max(1, cfg.turn_timeout_seconds));
    return p;
}

Runtime::Runtime(const Config& cfg)
    : config(cfg)
    , personas(cfg.database_path())
    , backend(cfg.database_path())
    , store(backend, personas)
    , missions(cfg.missions_path())
    , cache(cache_options(cfg))
    , provider(cfg.provider, cfg.max_tokens, cfg.temperature,
               cfg.llm_connect_timeout, cfg.llm_read_timeout)
    , loop(provider, tools, cache, loop_policy(cfg))
    , session(store, personas, registry, loop) {
    register_mission_tools(tools, missions);
    std::cerr << "[runtime] Database " << cfg.database_path()
              << ", missions " << cfg.missions_path()
              << ", model " << cfg.provider.model << "\n";
}

} // namespace spychat
