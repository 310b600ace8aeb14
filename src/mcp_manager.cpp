#include "mcp_manager.hpp"
#include "subprocess.hpp"
#include "utils.hpp"
#include <iostream>
#include <thread>
#include <chrono>

namespace toolchat {

McpManager::McpManager(ServerRegistry& registry, McpOptions opts)
    : registry_(registry), opts_(opts) {}

McpManager::~McpManager() {
    stop_all();
}

std::shared_ptr<McpClient> McpManager::find_client(const std::string& id) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    auto it = clients_.find(id);
    return it == clients_.end() ? nullptr : it->second;
}

void McpManager::start_server(const std::string& id) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    start_locked(id);
}

void McpManager::start_locked(const std::string& id) {
    auto def = registry_.find(id);
    if (!def) {
        throw McpError(McpErrorKind::spawn_failed, "Unknown server '" + id + "'");
    }

    std::shared_ptr<McpClient> stale;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = clients_.find(id);
        if (it != clients_.end()) {
            if (it->second->running()) {
                registry_.set_enabled(id, true);
                return;
            }
            stale = it->second;
            clients_.erase(it);
            tools_.erase(id);
        }
    }
    if (stale) {
        std::cerr << "[mcp:" << id << "] Reaping exited server\n";
        stale->stop();
    }

    auto client = std::make_shared<McpClient>(def, opts_.stop_grace_ms);
    client->start();

    std::vector<McpToolInfo> catalogue;
    if (opts_.handshake) {
        try {
            client->initialize(opts_.handshake_timeout_ms);
            catalogue = client->list_tools(opts_.handshake_timeout_ms);
        } catch (const McpError& e) {
            std::string tail = trim(client->stderr_tail());
            std::cerr << "[mcp:" << id << "] Handshake failed: " << e.what() << "\n";
            client->stop();
            std::string msg = "Handshake with '" + id + "' failed: " + e.what();
            if (!tail.empty()) msg += "\n" + tail;
            throw McpError(e.kind(), msg, e.payload());
        }
        std::cerr << "[mcp:" << id << "] " << catalogue.size() << " tool(s) available\n";
    }

    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_[id] = client;
        tools_[id] = std::move(catalogue);
    }
    registry_.set_enabled(id, true);
}

void McpManager::stop_server(const std::string& id) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    stop_locked(id);
    registry_.set_enabled(id, false);
}

void McpManager::stop_locked(const std::string& id) {
    std::shared_ptr<McpClient> client;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = clients_.find(id);
        if (it == clients_.end()) return;
        client = it->second;
        clients_.erase(it);
        tools_.erase(id);
    }
    client->stop();
}

void McpManager::update_server(ServerDefinition def) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    std::string id = def.id;

    auto current = find_client(id);
    bool was_running = current && current->running();

    if (!registry_.update(def)) {
        registry_.add(std::move(def), false);
    }
    if (!current) return;

    stop_locked(id);
    if (was_running) {
        std::cerr << "[mcp:" << id << "] Restarting with updated definition\n";
        start_locked(id);
    }
}

size_t McpManager::start_enabled() {
    size_t started = 0;
    for (auto& def : registry_.enabled()) {
        try {
            start_server(def.id);
            started++;
        } catch (const std::exception& e) {
            std::cerr << "[mcp] Failed to start server " << def.id << ": " << e.what() << "\n";
        }
    }
    return started;
}

void McpManager::stop_all() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    std::map<std::string, std::shared_ptr<McpClient>> all;
    {
        std::lock_guard<std::mutex> lock2(clients_mutex_);
        all.swap(clients_);
        tools_.clear();
    }
    for (auto& [id, client] : all) {
        client->stop();
    }
}

static std::string drain_stderr(Subprocess& proc, int timeout_ms) {
    std::string out;
    char buf[4096];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline && out.size() < 4096) {
        long n = Subprocess::read_some(proc.stderr_fd(), buf, sizeof(buf), 50);
        if (n == 0) break;
        if (n > 0) out.append(buf, static_cast<size_t>(n));
    }
    return trim(out);
}

ProbeResult McpManager::test_connection(const ServerDefinition& def) const {
    ProbeResult r;
    if (resolve_executable(def.command).empty()) {
        r.message = "Command '" + def.command + "' not found in PATH";
        return r;
    }

    SpawnOptions opts;
    opts.command = def.command;
    opts.args = def.args;
    opts.env = def.env;
    opts.working_dir = def.working_dir;

    Subprocess proc;
    try {
        proc.spawn(opts);
    } catch (const std::exception& e) {
        r.message = e.what();
        return r;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(opts_.probe_grace_ms));

    if (proc.alive()) {
        r.ok = true;
        r.message = "Server process is running (pid " + std::to_string(proc.pid()) + ")";
        proc.terminate(opts_.stop_grace_ms);
        proc.close_pipes();
        return r;
    }

    std::string err = drain_stderr(proc, 200);
    r.message = "Process exited with code " + std::to_string(proc.exit_code());
    if (!err.empty()) r.message += ": " + err;
    proc.close_pipes();
    return r;
}

bool McpManager::is_running(const std::string& id) const {
    auto client = find_client(id);
    return client && client->running();
}

std::vector<std::string> McpManager::running_ids() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto& [id, client] : clients_) {
        if (client->running()) ids.push_back(id);
    }
    return ids;
}

std::vector<McpToolInfo> McpManager::tools(const std::string& id) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    auto it = tools_.find(id);
    return it == tools_.end() ? std::vector<McpToolInfo>{} : it->second;
}

nlohmann::json McpManager::call(const std::string& server_id, const std::string& method,
                                const nlohmann::json& params) {
    return call(server_id, method, params, opts_.call_timeout_ms);
}

nlohmann::json McpManager::call(const std::string& server_id, const std::string& method,
                                const nlohmann::json& params, int timeout_ms) {
    auto client = find_client(server_id);
    if (!client || !client->running()) {
        throw McpError(McpErrorKind::not_running, "Server '" + server_id + "' is not running");
    }
    return client->call(method, params, timeout_ms);
}

nlohmann::json McpManager::call_tool(const std::string& server_id, const std::string& tool,
                                     const nlohmann::json& args) {
    auto client = find_client(server_id);
    if (!client || !client->running()) {
        throw McpError(McpErrorKind::not_running, "Server '" + server_id + "' is not running");
    }
    return client->call_tool(tool, args, opts_.call_timeout_ms);
}

} // namespace toolchat
