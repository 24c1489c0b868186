#include "commands.hpp"
#include "runtime.hpp"
#include "utils.hpp"
#include <iostream>
#include <fstream>

namespace spychat {

static const char* SAMPLE_MISSION = R"txt(MISSION: sample-1
STATUS: Archived
LOCATION: Lisbon

Recover the ledger left in locker 114 at Santa Apolonia station before the
courier arrives on the 06:40 train. Contact uses the phrase "the tide is late".
)txt";

int cmd_init() {
    std::string config_path = default_config_path();
    Config cfg;
    if (fs::exists(config_path)) {
        std::cout << "[init] Config already exists at " << config_path << "\n";
        cfg = Config::load(config_path);
    } else {
        cfg = Config::make_default();
        cfg.save(config_path);
        std::cout << "[init] Wrote " << config_path << "\n";
    }

    std::string missions = cfg.missions_path();
    fs::create_directories(missions);
    std::string sample = missions + "/sample-1.txt";
    if (!fs::exists(sample)) {
        std::ofstream f(sample);
        f << SAMPLE_MISSION;
        std::cout << "[init] Created sample mission " << sample << "\n";
    }

    // Opening the stores creates the tables.
    SqlitePersonaStore personas(cfg.database_path());
    SqliteConversationBackend conversations(cfg.database_path());

    std::cout << "\n=== spychat is ready ===\n\n"
              << "  Config:   " << config_path << "\n"
              << "  Database: " << cfg.database_path() << "\n"
              << "  Missions: " << missions << "\n\n"
              << "  Next: spychat spies add --name N --codename C, then spychat serve\n\n";
    return 0;
}

int cmd_chat(const std::string& spy_id, const std::string& message, const std::string& conversation_id) {
    if (spy_id.empty() || message.empty()) {
        std::cerr << "Usage: spychat chat SPY_ID -m MESSAGE [--conversation ID]\n";
        return 1;
    }
    Runtime rt(Config::load(default_config_path()));
    auto reply = rt.session.handle(ChatRequest{spy_id, conversation_id, message, ""});
    if (is_error(reply)) {
        std::cerr << "[" << error_kind_name(get_error(reply).kind) << "] " << get_error(reply).message << "\n";
        return 1;
    }
    auto& r = get_value(reply);
    std::cout << r.persona.display_name() << ": " << r.outcome.response_text << "\n";
    std::cerr << "[chat] conversation " << r.conversation_id << ", "
              << r.outcome.tool_calls_made.size() << " tool call(s)\n";
    return r.outcome.state == TurnState::done ? 0 : 2;
}

int cmd_spies(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: spychat spies <list|add|remove> [options]\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());
    SqlitePersonaStore store(cfg.database_path());
    std::string subcmd = args[0];

    if (subcmd == "list") {
        auto spies = store.list(0, 1000);
        if (spies.empty()) {
            std::cout << "No spies.\n";
            return 0;
        }
        for (auto& s : spies) {
            std::cout << "id=" << s.id << " codename=" << s.codename << " name=\"" << s.name << "\"";
            if (!s.specialty.empty()) std::cout << " specialty=\"" << s.specialty << "\"";
            std::cout << "\n";
        }
        return 0;
    }
    else if (subcmd == "add") {
        Persona p;
        for (size_t i = 1; i < args.size(); i++) {
            if (args[i] == "--id" && i + 1 < args.size()) p.id = args[++i];
            else if (args[i] == "--name" && i + 1 < args.size()) p.name = args[++i];
            else if (args[i] == "--codename" && i + 1 < args.size()) p.codename = args[++i];
            else if (args[i] == "--biography" && i + 1 < args.size()) p.biography = args[++i];
            else if (args[i] == "--specialty" && i + 1 < args.size()) p.specialty = args[++i];
        }
        if (p.name.empty() || p.codename.empty()) {
            std::cerr << "Usage: spychat spies add --name N --codename C [--id ID] [--biography B] [--specialty S]\n";
            return 1;
        }
        auto created = store.create(p);
        if (is_error(created)) {
            std::cerr << get_error(created).message << "\n";
            return 1;
        }
        std::cout << "Added spy: id=" << get_value(created).id << " codename=" << p.codename << "\n";
        return 0;
    }
    else if (subcmd == "remove") {
        if (args.size() < 2) {
            std::cerr << "Usage: spychat spies remove SPY_ID\n";
            return 1;
        }
        if (!store.remove(args[1])) {
            std::cerr << "Spy not found: " << args[1] << "\n";
            return 1;
        }
        std::cout << "Removed spy " << args[1] << "\n";
        return 0;
    }

    std::cerr << "Unknown spies subcommand: " << subcmd << "\n";
    return 1;
}

int cmd_history(const std::string& conversation_id) {
    if (conversation_id.empty()) {
        std::cerr << "Usage: spychat history CONVERSATION_ID\n";
        return 1;
    }
    Config cfg = Config::load(default_config_path());
    SqlitePersonaStore personas(cfg.database_path());
    SqliteConversationBackend backend(cfg.database_path());
    ConversationStore store(backend, personas);

    auto log = store.get(conversation_id);
    if (is_error(log)) {
        std::cerr << get_error(log).message << "\n";
        return 1;
    }
    auto& l = get_value(log);
    std::cout << "Conversation " << l.id << " (spy " << l.owner_id << "), "
              << l.messages.size() << " messages, updated " << iso_time(l.updated_at / 1000) << "\n\n";
    for (auto& m : l.messages) {
        std::cout << "[" << role_name(m.role) << "] ";
        for (auto& tc : m.tool_calls) std::cout << "(calls " << tc.name << " " << tc.arguments.dump() << ") ";
        std::cout << m.text() << "\n";
    }
    return 0;
}

} // namespace spychat
