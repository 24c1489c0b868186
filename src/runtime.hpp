#pragma once
#include "config.hpp"
#include "persona.hpp"
#include "conversation_store.hpp"
#include "connection_registry.hpp"
#include "mission_tools.hpp"
#include "mission_cache.hpp"
#include "tool_registry.hpp"
#include "provider.hpp"
#include "tool_call_loop.hpp"
#include "chat_session.hpp"

namespace spychat {

CacheOptions cache_options(const Config& cfg);
LoopPolicy loop_policy(const Config& cfg);

// Composition root: every long-lived component of one process, wired from
// the config. Members are declared in dependency order.
struct Runtime {
    explicit Runtime(const Config& cfg);

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    Config config;
    SqlitePersonaStore personas;
    SqliteConversationBackend backend;
    ConversationStore store;
    ConnectionRegistry registry;
    FileMissionBackend missions;
    ToolRegistry tools;
    MissionContextCache cache;
    OpenAiProvider provider;
    ToolCallLoop loop;
    ChatSession session;
};

} // namespace spychat
