#pragma once
#include "server_registry.hpp"
#include "subprocess.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <future>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace toolchat {

enum class McpErrorKind {
    spawn_failed,
    not_running,
    write_failed,
    no_response,
    timeout,
    rpc_error,
    invalid_response
};

const char* to_string(McpErrorKind kind);

class McpError : public std::runtime_error {
public:
    McpError(McpErrorKind kind, const std::string& what, nlohmann::json payload = nullptr)
        : std::runtime_error(what), kind_(kind), payload_(std::move(payload)) {}

    McpErrorKind kind() const { return kind_; }
    // The server's "error" member for rpc_error, null otherwise.
    const nlohmann::json& payload() const { return payload_; }

private:
    McpErrorKind kind_;
    nlohmann::json payload_;
};

struct McpToolInfo {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

// One running tool server: owns the process and correlates newline-delimited
// JSON-RPC requests with their responses by id.
class McpClient {
public:
    explicit McpClient(ServerDefinitionPtr def, int stop_grace_ms = 3000);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    // Spawns the process and the pipe readers. Throws McpError(spawn_failed).
    void start();
    // Fails every pending request, then terminates the process. Idempotent.
    void stop();

    bool running() const;

    // Sends a request and blocks until the matching response arrives.
    // timeout_ms <= 0 waits until the server answers or its pipe closes.
    nlohmann::json call(const std::string& method, const nlohmann::json& params, int timeout_ms);
    bool notify(const std::string& method, const nlohmann::json& params = nullptr);

    // initialize + notifications/initialized
    nlohmann::json initialize(int timeout_ms);
    std::vector<McpToolInfo> list_tools(int timeout_ms);
    nlohmann::json call_tool(const std::string& tool, const nlohmann::json& args, int timeout_ms);

    const std::string& id() const { return def_->id; }
    ServerDefinitionPtr definition() const { return def_; }
    pid_t pid() const { return proc_.pid(); }
    std::string stderr_tail() const;
    size_t pending_count() const;

private:
    using PendingSlot = std::shared_ptr<std::promise<nlohmann::json>>;

    ServerDefinitionPtr def_;
    int stop_grace_ms_;
    Subprocess proc_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> readers_running_{false};
    std::atomic<int64_t> next_id_{1};

    mutable std::mutex pending_mutex_;
    std::map<int64_t, PendingSlot> pending_;
    bool closed_ = false;               // guarded by pending_mutex_

    std::mutex write_mutex_;

    mutable std::mutex stderr_mutex_;
    std::string stderr_tail_;
    bool stderr_logged_ = false;

    std::thread stdout_thread_;
    std::thread stderr_thread_;

    void read_stdout_loop();
    void read_stderr_loop();
    void handle_line(const std::string& line);
    void handle_server_request(const nlohmann::json& msg);
    void fail_all(McpErrorKind kind, const std::string& reason);
    bool write_line(const std::string& line);
};

} // namespace toolchat
