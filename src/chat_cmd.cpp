#include "chat_cmd.hpp"
#include "servers_cmd.hpp"
#include "conversation.hpp"
#include "confirmation.hpp"
#include "tool_run_store.hpp"
#include "tools/builtin_tools.hpp"
#include <iostream>
#include <memory>

namespace toolchat {

static void print_tools(const ToolRegistry& tools, McpManager& mcp) {
    for (auto& name : tools.tool_names()) {
        std::cout << "  " << kLocalNamespace << kNamespaceDelimiter << name
                  << (tools.is_enabled(name) ? "" : " (disabled)") << "\n";
    }
    for (auto& id : mcp.running_ids()) {
        for (auto& t : mcp.tools(id)) {
            std::cout << "  " << id << kNamespaceDelimiter << t.name << "\n";
        }
    }
}

static void print_servers(McpManager& mcp) {
    auto& registry = mcp.registry();
    if (registry.size() == 0) {
        std::cout << "No tool servers configured\n";
        return;
    }
    for (auto& def : registry.list()) {
        std::string state = mcp.is_running(def->id) ? "running"
                          : registry.is_enabled(def->id) ? "enabled, not running" : "disabled";
        std::cout << "  " << def->id << " [" << state << "] "
                  << mcp.tools(def->id).size() << " tool(s)\n";
    }
}

int cmd_chat(const std::string& config_path, const std::string& message,
             const std::string& model_override) {
    Config cfg = Config::load(config_path);
    if (!model_override.empty()) cfg.provider.model = model_override;

    ServerRegistry registry;
    cfg.populate(registry);
    McpManager mcp(registry, make_mcp_options(cfg));
    mcp.start_enabled();

    ToolRegistry tools;
    ConfirmationGate gate(cfg.confirm_timeout_ms);
    prompt_on_terminal(gate);
    register_builtin_tools(tools, cfg, gate);

    std::unique_ptr<ToolRunStore> runs;
    if (!cfg.tool_runs_db.empty()) {
        try {
            runs = std::make_unique<ToolRunStore>(cfg.tool_runs_path());
        } catch (const std::exception& e) {
            std::cerr << "[warn] Tool-run log disabled: " << e.what() << "\n";
        }
    }

    ToolDispatcher dispatcher(tools, mcp, runs.get(), make_result_limits(cfg));
    OllamaProvider provider(cfg.provider);
    ToolConversation convo(provider, dispatcher, cfg.system_prompt,
                           ChatOptions::from_config(cfg.provider));

    std::vector<Message> history;
    auto run_turn = [&](const std::string& text) -> bool {
        try {
            auto summary = convo.stream_with_tools(
                text, history,
                [](const std::string& chunk) {
                    std::cout << chunk << std::flush;
                },
                [](const ParsedToolCall& call, const ToolOutcome& outcome) {
                    std::cerr << "\n[chat] " << call.name << " -> "
                              << (outcome.is_error ? "error" : "ok") << " ("
                              << outcome.output.size() << " chars)\n";
                });
            std::cout << "\n";
            history.insert(history.end(), summary.transcript.begin(), summary.transcript.end());
            return true;
        } catch (const std::exception& e) {
            std::cerr << "\n[error] " << e.what() << "\n";
            return false;
        }
    };

    if (!message.empty()) {
        return run_turn(message) ? 0 : 1;
    }

    std::cout << "toolchat (" << provider.name() << ", " << cfg.provider.model << ")\n"
              << "Commands: /tools /servers /help | exit/quit/:q | Ctrl+D\n";
    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        line = trim(line);
        if (line.empty()) continue;
        if (line == "exit" || line == "quit" || line == ":q") break;

        if (line == "/tools") {
            print_tools(tools, mcp);
            continue;
        }
        if (line == "/servers") {
            print_servers(mcp);
            continue;
        }
        if (line == "/help") {
            std::cout << "/tools    list callable tools\n"
                      << "/servers  show tool servers\n"
                      << "exit      leave\n";
            continue;
        }
        run_turn(line);
    }
    return 0;
}

} // namespace toolchat
