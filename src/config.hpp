#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "server_registry.hpp"
#include "utils.hpp"

namespace toolchat {

struct ProviderConfig {
    std::string api_base = "http://127.0.0.1:11434";
    std::string model = "llama3.1";
    double temperature = 0.7;
    int max_tokens = 2048;
};

struct McpServerConfig {
    ServerDefinition definition;
    bool enabled = false;
};

struct Config {
    ProviderConfig provider;
    std::string system_prompt = "You are a helpful assistant.";

    // Timeouts (milliseconds)
    int tool_timeout_ms = 30000;       // <= 0: wait for the server indefinitely
    int handshake_timeout_ms = 10000;
    int probe_grace_ms = 500;
    int stop_grace_ms = 3000;
    int confirm_timeout_ms = 30000;

    bool mcp_handshake = true;
    std::string tool_runs_db = "~/.toolchat/tool_runs.db";  // empty = no tool-run log
    std::vector<std::string> screenshot_command = {"import", "-window", "root", "png:-"};

    // Tool results larger than this are cut to truncated_result_bytes
    size_t max_tool_result_bytes = 1000000;
    size_t truncated_result_bytes = 500000;
    // Built-in tools (by name, without "local::") that are switched off
    std::vector<std::string> disabled_tools;

    // MCP servers keyed by id
    std::map<std::string, McpServerConfig> mcp_servers;

    std::string tool_runs_path() const {
        return expand_path(tool_runs_db);
    }

    // Fills a registry with every configured server and its enabled flag.
    void populate(ServerRegistry& registry) const;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace toolchat
