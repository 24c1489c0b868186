#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include "commands.hpp"
#include "gateway.hpp"

static void print_usage() {
    std::cout << "Usage: spychat <command> [options]\n\n"
              << "Commands:\n"
              << "  init                        Initialize ~/.spychat\n"
              << "  serve [--host H] [--port P] Start the HTTP gateway\n"
              << "  chat SPY_ID -m MSG [--conversation ID]\n"
              << "                              Run one turn against a spy\n"
              << "  spies list|add|remove       Manage spies\n"
              << "  history CONVERSATION_ID     Print a conversation log\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    try {
        if (cmd == "init") {
            return spychat::cmd_init();
        }
        else if (cmd == "serve") {
            std::string host;
            int port = 0;
            for (size_t i = 0; i < args.size(); i++) {
                if (args[i] == "--host" && i + 1 < args.size()) {
                    host = args[++i];
                } else if (args[i] == "--port" && i + 1 < args.size()) {
                    port = std::atoi(args[++i].c_str());
                }
            }
            return spychat::cmd_serve(host, port);
        }
        else if (cmd == "chat") {
            std::string spy_id, message, conversation_id;
            for (size_t i = 0; i < args.size(); i++) {
                if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size()) {
                    message = args[++i];
                } else if (args[i] == "--conversation" && i + 1 < args.size()) {
                    conversation_id = args[++i];
                } else if (spy_id.empty()) {
                    spy_id = args[i];
                }
            }
            return spychat::cmd_chat(spy_id, message, conversation_id);
        }
        else if (cmd == "spies") {
            return spychat::cmd_spies(args);
        }
        else if (cmd == "history") {
            return spychat::cmd_history(args.empty() ? "" : args[0]);
        }
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
}
