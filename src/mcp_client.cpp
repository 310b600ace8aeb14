#include "mcp_client.hpp"
#include "utils.hpp"
#include <iostream>
#include <chrono>

namespace toolchat {

static constexpr size_t kStderrTailBytes = 4096;
static constexpr int kReaderPollMs = 100;

const char* to_string(McpErrorKind kind) {
    switch (kind) {
        case McpErrorKind::spawn_failed: return "spawn_failed";
        case McpErrorKind::not_running: return "not_running";
        case McpErrorKind::write_failed: return "write_failed";
        case McpErrorKind::no_response: return "no_response";
        case McpErrorKind::timeout: return "timeout";
        case McpErrorKind::rpc_error: return "rpc_error";
        case McpErrorKind::invalid_response: return "invalid_response";
    }
    return "unknown";
}

static std::string shorten(const std::string& s, size_t max = 120) {
    if (s.size() <= max) return s;
    return s.substr(0, max) + "...";
}

McpClient::McpClient(ServerDefinitionPtr def, int stop_grace_ms)
    : def_(std::move(def)), stop_grace_ms_(stop_grace_ms) {
    if (!def_) throw std::invalid_argument("McpClient requires a server definition");
}

McpClient::~McpClient() {
    stop();
}

void McpClient::start() {
    if (started_.exchange(true)) return;

    SpawnOptions opts;
    opts.command = def_->command;
    opts.args = def_->args;
    opts.env = def_->env;
    opts.working_dir = def_->working_dir;

    try {
        proc_.spawn(opts);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            closed_ = true;
        }
        stopped_ = true;
        throw McpError(McpErrorKind::spawn_failed, e.what());
    }

    readers_running_ = true;
    stdout_thread_ = std::thread(&McpClient::read_stdout_loop, this);
    stderr_thread_ = std::thread(&McpClient::read_stderr_loop, this);
    std::cerr << "[mcp:" << id() << "] Started (pid " << proc_.pid() << ")\n";
}

void McpClient::stop() {
    if (!started_ || stopped_.exchange(true)) return;

    fail_all(McpErrorKind::no_response, "Server stopped");
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        proc_.close_stdin();
    }
    proc_.terminate(stop_grace_ms_);

    readers_running_ = false;
    if (stdout_thread_.joinable()) stdout_thread_.join();
    if (stderr_thread_.joinable()) stderr_thread_.join();
    proc_.close_pipes();
    std::cerr << "[mcp:" << id() << "] Stopped\n";
}

bool McpClient::running() const {
    if (!started_ || stopped_) return false;
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return !closed_;
}

std::string McpClient::stderr_tail() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return stderr_tail_;
}

size_t McpClient::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

// ── Requests ──

bool McpClient::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return proc_.write_all(line + "\n");
}

nlohmann::json McpClient::call(const std::string& method, const nlohmann::json& params, int timeout_ms) {
    if (!started_ || stopped_) {
        throw McpError(McpErrorKind::not_running, "Server '" + id() + "' is not running");
    }

    int64_t req_id = next_id_++;
    auto slot = std::make_shared<std::promise<nlohmann::json>>();
    auto result = slot->get_future();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (closed_) {
            throw McpError(McpErrorKind::not_running, "Server '" + id() + "' is not running");
        }
        pending_[req_id] = slot;
    }

    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", req_id},
        {"method", method}
    };
    if (!params.is_null()) {
        req["params"] = params;
    }

    if (!write_line(req.dump())) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.erase(req_id);
        }
        throw McpError(McpErrorKind::write_failed,
                       "Failed to write '" + method + "' to server '" + id() + "'");
    }

    if (timeout_ms > 0 &&
        result.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::timeout) {
        bool abandoned = false;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            abandoned = pending_.erase(req_id) > 0;
        }
        // If the entry is already gone the response won the race.
        if (abandoned) {
            std::cerr << "[mcp:" << id() << "] Request " << req_id << " (" << method
                      << ") timed out after " << timeout_ms << " ms\n";
            notify("notifications/cancelled", {
                {"requestId", req_id},
                {"reason", "Request timed out"}
            });
            throw McpError(McpErrorKind::timeout,
                           "Request '" + method + "' to server '" + id() + "' timed out after " +
                           std::to_string(timeout_ms) + " ms");
        }
    }
    return result.get();
}

bool McpClient::notify(const std::string& method, const nlohmann::json& params) {
    nlohmann::json notif = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) {
        notif["params"] = params;
    }
    return write_line(notif.dump());
}

nlohmann::json McpClient::initialize(int timeout_ms) {
    auto result = call("initialize", {
        {"protocolVersion", "2025-06-18"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "toolchat"}, {"version", "0.1.0"}}}
    }, timeout_ms);
    notify("notifications/initialized");
    return result;
}

std::vector<McpToolInfo> McpClient::list_tools(int timeout_ms) {
    std::vector<McpToolInfo> tools;
    std::string cursor;

    while (true) {
        nlohmann::json params = nlohmann::json::object();
        if (!cursor.empty()) params["cursor"] = cursor;

        auto result = call("tools/list", params, timeout_ms);
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
            throw McpError(McpErrorKind::invalid_response,
                           "tools/list from '" + id() + "' has no tools array");
        }

        for (auto& t : result["tools"]) {
            if (!t.is_object()) continue;
            McpToolInfo info;
            info.name = t.value("name", "");
            if (info.name.empty()) continue;
            info.description = t.value("description", "");
            if (t.contains("inputSchema")) {
                info.input_schema = t["inputSchema"];
            } else {
                info.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
            }
            tools.push_back(std::move(info));
        }

        if (!result.contains("nextCursor") || !result["nextCursor"].is_string()) break;
        std::string next = result["nextCursor"].get<std::string>();
        if (next.empty() || next == cursor) break;
        cursor = next;
    }
    return tools;
}

nlohmann::json McpClient::call_tool(const std::string& tool, const nlohmann::json& args,
                                    int timeout_ms) {
    nlohmann::json arguments = args.is_null() ? nlohmann::json::object() : args;
    return call("tools/call", {
        {"name", tool},
        {"arguments", arguments}
    }, timeout_ms);
}

// ── Pipe readers ──

void McpClient::read_stdout_loop() {
    std::string buffer;
    char chunk[4096];

    while (readers_running_) {
        long n = Subprocess::read_some(proc_.stdout_fd(), chunk, sizeof(chunk), kReaderPollMs);
        if (n < 0) continue;
        if (n == 0) {
            if (!buffer.empty()) handle_line(buffer);
            if (!stopped_) {
                std::cerr << "[mcp:" << id() << "] Server closed its output\n";
            }
            fail_all(McpErrorKind::no_response,
                     "No response: server '" + id() + "' exited");
            return;
        }

        buffer.append(chunk, static_cast<size_t>(n));
        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            handle_line(line);
        }
    }
}

void McpClient::read_stderr_loop() {
    char chunk[4096];

    while (readers_running_) {
        long n = Subprocess::read_some(proc_.stderr_fd(), chunk, sizeof(chunk), kReaderPollMs);
        if (n < 0) continue;
        if (n == 0) return;

        std::lock_guard<std::mutex> lock(stderr_mutex_);
        stderr_tail_.append(chunk, static_cast<size_t>(n));
        if (stderr_tail_.size() > kStderrTailBytes) {
            stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
        }
        if (!stderr_logged_) {
            size_t nl = stderr_tail_.find('\n');
            if (nl != std::string::npos) {
                std::cerr << "[mcp:" << id() << "] stderr: "
                          << shorten(stderr_tail_.substr(0, nl)) << "\n";
                stderr_logged_ = true;
            }
        }
    }
}

void McpClient::handle_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty()) return;

    auto msg = nlohmann::json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        std::cerr << "[mcp:" << id() << "] Skipping malformed line: " << shorten(line) << "\n";
        return;
    }

    bool has_id = msg.contains("id") && !msg["id"].is_null();

    if (msg.contains("method")) {
        if (has_id) {
            handle_server_request(msg);
        } else {
            std::cerr << "[mcp:" << id() << "] Notification: "
                      << msg["method"].dump() << "\n";
        }
        return;
    }

    if (!has_id || !msg["id"].is_number_integer()) return;
    int64_t resp_id = msg["id"].get<int64_t>();

    PendingSlot slot;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(resp_id);
        if (it == pending_.end()) return;
        slot = it->second;
        pending_.erase(it);
    }

    if (msg.contains("error")) {
        auto& err = msg["error"];
        std::string text;
        if (err.is_object() && err.contains("message") && err["message"].is_string()) {
            text = err["message"].get<std::string>();
        } else {
            text = err.dump();
        }
        slot->set_exception(std::make_exception_ptr(
            McpError(McpErrorKind::rpc_error, "Server '" + id() + "' returned an error: " + text, err)));
    } else if (msg.contains("result")) {
        slot->set_value(msg["result"]);
    } else {
        slot->set_exception(std::make_exception_ptr(
            McpError(McpErrorKind::invalid_response,
                     "Invalid response from '" + id() + "': no result or error")));
    }
}

void McpClient::handle_server_request(const nlohmann::json& msg) {
    std::string method = msg["method"].is_string() ? msg["method"].get<std::string>() : "";
    nlohmann::json reply = {
        {"jsonrpc", "2.0"},
        {"id", msg["id"]}
    };

    if (method == "ping") {
        reply["result"] = nlohmann::json::object();
    } else if (method == "roots/list") {
        reply["result"] = {{"roots", nlohmann::json::array()}};
    } else {
        reply["error"] = {
            {"code", -32601},
            {"message", "Method not found: " + method}
        };
    }

    if (!write_line(reply.dump())) {
        std::cerr << "[mcp:" << id() << "] Failed to answer server request " << method << "\n";
    }
}

void McpClient::fail_all(McpErrorKind kind, const std::string& reason) {
    std::map<int64_t, PendingSlot> orphaned;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        closed_ = true;
        orphaned.swap(pending_);
    }
    for (auto& [req_id, slot] : orphaned) {
        slot->set_exception(std::make_exception_ptr(McpError(kind, reason)));
    }
}

} // namespace toolchat
