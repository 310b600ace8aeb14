#pragma once
#include "mcp_client.hpp"
#include "server_registry.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace toolchat {

struct McpOptions {
    int call_timeout_ms = 30000;        // <= 0: unbounded
    int handshake_timeout_ms = 10000;
    int probe_grace_ms = 500;
    int stop_grace_ms = 3000;
    bool handshake = true;
};

struct ProbeResult {
    bool ok = false;
    std::string message;
};

// Supervises one McpClient per enabled server. Lifecycle operations are
// serialized; calls to different servers run concurrently.
class McpManager {
public:
    explicit McpManager(ServerRegistry& registry, McpOptions opts = {});
    ~McpManager();

    McpManager(const McpManager&) = delete;
    McpManager& operator=(const McpManager&) = delete;

    // No-op when already running. Marks the server enabled on success.
    // Throws McpError on spawn or handshake failure.
    void start_server(const std::string& id);
    // Safe when not running. Marks the server disabled.
    void stop_server(const std::string& id);
    // Replaces the definition; a running server is restarted with it.
    void update_server(ServerDefinition def);
    // Starts every enabled server, logging failures instead of throwing.
    size_t start_enabled();
    void stop_all();

    // Liveness probe: spawn, wait probe_grace_ms, check the process is alive.
    ProbeResult test_connection(const ServerDefinition& def) const;

    bool is_running(const std::string& id) const;
    std::vector<std::string> running_ids() const;
    std::vector<McpToolInfo> tools(const std::string& id) const;

    nlohmann::json call(const std::string& server_id, const std::string& method,
                        const nlohmann::json& params);
    nlohmann::json call(const std::string& server_id, const std::string& method,
                        const nlohmann::json& params, int timeout_ms);
    // tools/call on a running server, returns the raw result object.
    nlohmann::json call_tool(const std::string& server_id, const std::string& tool,
                             const nlohmann::json& args);

    ServerRegistry& registry() { return registry_; }
    const McpOptions& options() const { return opts_; }

private:
    ServerRegistry& registry_;
    McpOptions opts_;

    std::mutex lifecycle_mutex_;
    mutable std::mutex clients_mutex_;
    std::map<std::string, std::shared_ptr<McpClient>> clients_;
    std::map<std::string, std::vector<McpToolInfo>> tools_;

    std::shared_ptr<McpClient> find_client(const std::string& id) const;
    void start_locked(const std::string& id);
    void stop_locked(const std::string& id);
};

} // namespace toolchat
