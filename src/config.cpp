#include "config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace toolchat {

Config Config::make_default() {
    return Config{};
}

void Config::populate(ServerRegistry& registry) const {
    for (auto& [id, srv] : mcp_servers) {
        ServerDefinition def = srv.definition;
        def.id = id;
        try {
            registry.add(std::move(def), srv.enabled);
        } catch (const std::exception& e) {
            std::cerr << "[config] Skipping server '" << id << "': " << e.what() << "\n";
        }
    }
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["provider"] = {
        {"api_base", provider.api_base},
        {"model", provider.model},
        {"temperature", provider.temperature},
        {"max_tokens", provider.max_tokens}
    };
    j["system_prompt"] = system_prompt;

    j["tool_timeout_ms"] = tool_timeout_ms;
    j["handshake_timeout_ms"] = handshake_timeout_ms;
    j["probe_grace_ms"] = probe_grace_ms;
    j["stop_grace_ms"] = stop_grace_ms;
    j["confirm_timeout_ms"] = confirm_timeout_ms;
    j["mcp_handshake"] = mcp_handshake;
    j["tool_runs_db"] = tool_runs_db;
    j["screenshot_command"] = screenshot_command;
    j["max_tool_result_bytes"] = max_tool_result_bytes;
    j["truncated_result_bytes"] = truncated_result_bytes;
    j["disabled_tools"] = disabled_tools;

    j["mcp_servers"] = nlohmann::json::object();
    for (auto& [id, srv] : mcp_servers) {
        auto s = srv.definition.to_json();
        s["enabled"] = srv.enabled;
        j["mcp_servers"][id] = s;
    }
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    if (j.contains("provider") && j["provider"].is_object()) {
        auto& p = j["provider"];
        c.provider.api_base = p.value("api_base", c.provider.api_base);
        c.provider.model = p.value("model", c.provider.model);
        c.provider.temperature = p.value("temperature", c.provider.temperature);
        c.provider.max_tokens = p.value("max_tokens", c.provider.max_tokens);
    }
    c.system_prompt = j.value("system_prompt", c.system_prompt);

    c.tool_timeout_ms = j.value("tool_timeout_ms", c.tool_timeout_ms);
    c.handshake_timeout_ms = j.value("handshake_timeout_ms", c.handshake_timeout_ms);
    c.probe_grace_ms = j.value("probe_grace_ms", c.probe_grace_ms);
    c.stop_grace_ms = j.value("stop_grace_ms", c.stop_grace_ms);
    c.confirm_timeout_ms = j.value("confirm_timeout_ms", c.confirm_timeout_ms);
    c.mcp_handshake = j.value("mcp_handshake", c.mcp_handshake);
    c.tool_runs_db = j.value("tool_runs_db", c.tool_runs_db);

    if (j.contains("screenshot_command") && j["screenshot_command"].is_array()) {
        c.screenshot_command.clear();
        for (auto& a : j["screenshot_command"]) {
            if (a.is_string()) c.screenshot_command.push_back(a.get<std::string>());
        }
    }

    c.max_tool_result_bytes = j.value("max_tool_result_bytes", c.max_tool_result_bytes);
    c.truncated_result_bytes = j.value("truncated_result_bytes", c.truncated_result_bytes);
    if (j.contains("disabled_tools") && j["disabled_tools"].is_array()) {
        for (auto& t : j["disabled_tools"]) {
            if (t.is_string()) c.disabled_tools.push_back(t.get<std::string>());
        }
    }

    if (j.contains("mcp_servers") && j["mcp_servers"].is_object()) {
        for (auto& [id, srv] : j["mcp_servers"].items()) {
            if (!srv.is_object()) continue;
            McpServerConfig mcp;
            mcp.definition = ServerDefinition::from_json(id, srv);
            mcp.enabled = srv.value("enabled", false);
            c.mcp_servers[id] = std::move(mcp);
        }
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
    if (!f) {
        throw std::runtime_error("Failed to write config: " + path);
    }
    f << to_json().dump(2) << std::endl;
}

} // namespace toolchat
