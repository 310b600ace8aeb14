#include "servers_cmd.hpp"
#include "tool_dispatch.hpp"
#include "tool_run_store.hpp"
#include "tools/builtin_tools.hpp"
#include <iostream>
#include <memory>
#include <ctime>
#include <algorithm>

namespace toolchat {

McpOptions make_mcp_options(const Config& cfg) {
    McpOptions opts;
    opts.call_timeout_ms = cfg.tool_timeout_ms;
    opts.handshake_timeout_ms = cfg.handshake_timeout_ms;
    opts.probe_grace_ms = cfg.probe_grace_ms;
    opts.stop_grace_ms = cfg.stop_grace_ms;
    opts.handshake = cfg.mcp_handshake;
    return opts;
}

ResultLimits make_result_limits(const Config& cfg) {
    ResultLimits limits;
    limits.max_bytes = cfg.max_tool_result_bytes;
    limits.truncate_to = std::min(cfg.truncated_result_bytes, cfg.max_tool_result_bytes);
    return limits;
}

void prompt_on_terminal(ConfirmationGate& gate) {
    gate.set_prompt_handler([&gate](uint64_t id, const std::string& description) {
        std::cout << "\n[confirm] " << description << "? [y/N] " << std::flush;
        std::string answer;
        bool approved = std::getline(std::cin, answer) &&
                        (to_lower(trim(answer)) == "y" || to_lower(trim(answer)) == "yes");
        gate.resolve(id, approved);
    });
}

static std::string format_time(int64_t ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

int cmd_servers(const std::string& config_path) {
    Config cfg = Config::load(config_path);
    ServerRegistry registry;
    cfg.populate(registry);

    if (registry.size() == 0) {
        std::cout << "No tool servers configured in " << config_path << "\n";
        return 0;
    }

    for (auto& def : registry.list()) {
        std::cout << (registry.is_enabled(def->id) ? "[on]  " : "[off] ") << def->id;
        if (def->name != def->id) std::cout << " (" << def->name << ")";
        std::cout << "\n      " << def->command;
        for (auto& a : def->args) std::cout << " " << a;
        std::cout << "\n";
        if (!def->description.empty()) std::cout << "      " << def->description << "\n";
        if (!def->working_dir.empty()) std::cout << "      cwd: " << def->working_dir << "\n";
    }
    return 0;
}

int cmd_test(const std::string& config_path, const std::string& server_id) {
    Config cfg = Config::load(config_path);
    ServerRegistry registry;
    cfg.populate(registry);

    auto def = registry.find(server_id);
    if (!def) {
        std::cerr << "[error] Unknown server: " << server_id << "\n";
        return 1;
    }

    McpManager mcp(registry, make_mcp_options(cfg));
    auto probe = mcp.test_connection(*def);
    std::cout << (probe.ok ? "OK   " : "FAIL ") << server_id << ": " << probe.message << "\n";
    return probe.ok ? 0 : 1;
}

int cmd_call(const std::string& config_path, const std::string& server_id,
             const std::string& tool, const std::string& args_json) {
    Config cfg = Config::load(config_path);
    ServerRegistry registry;
    cfg.populate(registry);

    auto args = nlohmann::json::parse(args_json.empty() ? "{}" : args_json, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        std::cerr << "[error] Arguments must be a JSON object\n";
        return 1;
    }

    McpManager mcp(registry, make_mcp_options(cfg));
    if (to_lower(server_id) != kLocalNamespace) {
        try {
            mcp.start_server(server_id);
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 1;
        }
    }

    ToolRegistry tools;
    ConfirmationGate gate(cfg.confirm_timeout_ms);
    prompt_on_terminal(gate);
    register_builtin_tools(tools, cfg, gate);

    std::unique_ptr<ToolRunStore> runs;
    if (!cfg.tool_runs_db.empty()) {
        try {
            runs = std::make_unique<ToolRunStore>(cfg.tool_runs_path());
        } catch (const std::exception& e) {
            std::cerr << "[warn] " << e.what() << "\n";
        }
    }

    ToolDispatcher dispatcher(tools, mcp, runs.get(), make_result_limits(cfg));
    ParsedToolCall call{server_id + kNamespaceDelimiter + tool, args};
    auto outcome = dispatcher.dispatch(call);
    std::cout << outcome.output << "\n";
    return outcome.is_error ? 1 : 0;
}

int cmd_runs(const std::string& config_path, int limit) {
    Config cfg = Config::load(config_path);
    if (cfg.tool_runs_db.empty()) {
        std::cout << "Tool-run log is disabled\n";
        return 0;
    }

    try {
        ToolRunStore store(cfg.tool_runs_path());
        auto runs = store.recent(limit);
        if (runs.empty()) {
            std::cout << "No tool runs recorded\n";
            return 0;
        }
        for (auto& r : runs) {
            std::string out = r.output;
            if (out.size() > 80) out = out.substr(0, 80) + "...";
            for (auto& c : out) if (c == '\n') c = ' ';
            std::cout << "#" << r.id << " " << format_time(r.created_at) << " "
                      << (r.is_error ? "ERR " : "OK  ") << r.tool << " " << r.arguments << "\n"
                      << "    " << out << "\n";
        }
        std::cout << store.count() << " run(s) total\n";
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace toolchat
