#include <iostream>
#include <string>
#include <vector>
#include "utils.hpp"
#include "chat_cmd.hpp"
#include "servers_cmd.hpp"

static void print_usage() {
    std::cout << "Usage: toolchat <command> [options] [--config PATH]\n\n"
              << "Commands:\n"
              << "  chat [-m MSG] [--model MODEL]\n"
              << "                              Chat with tools (interactive or single message)\n"
              << "  servers                     List configured tool servers\n"
              << "  test <id>                   Check that a server process starts and stays up\n"
              << "  call <server> <tool> [JSON] Invoke a tool directly (server 'local' for built-ins)\n"
              << "  runs [N]                    Show the last N tool runs (default 20)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::string config_path = toolchat::default_config_path();
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = toolchat::expand_path(argv[++i]);
        } else {
            args.push_back(a);
        }
    }

    if (cmd == "chat") {
        std::string message;
        std::string model_override;
        for (size_t i = 0; i < args.size(); i++) {
            if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size()) {
                message = args[++i];
            } else if (args[i] == "--model" && i + 1 < args.size()) {
                model_override = args[++i];
            }
        }
        return toolchat::cmd_chat(config_path, message, model_override);
    }
    else if (cmd == "servers") {
        return toolchat::cmd_servers(config_path);
    }
    else if (cmd == "test") {
        if (args.empty()) {
            std::cerr << "Usage: toolchat test <id>\n";
            return 1;
        }
        return toolchat::cmd_test(config_path, args[0]);
    }
    else if (cmd == "call") {
        if (args.size() < 2) {
            std::cerr << "Usage: toolchat call <server> <tool> [JSON]\n";
            return 1;
        }
        return toolchat::cmd_call(config_path, args[0], args[1], args.size() > 2 ? args[2] : "{}");
    }
    else if (cmd == "runs") {
        int limit = 20;
        if (!args.empty()) {
            try {
                limit = std::stoi(args[0]);
            } catch (const std::exception&) {
                std::cerr << "Invalid count: " << args[0] << "\n";
                return 1;
            }
        }
        return toolchat::cmd_runs(config_path, limit);
    }
    else if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
