#include "tool_run_store.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <iostream>

namespace toolchat {

static std::string column_text(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

ToolRunStore::ToolRunStore(const std::string& db_path) {
    auto parent = fs::path(db_path).parent_path();
    if (db_path != ":memory:" && !parent.empty()) fs::create_directories(parent);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open tool-run DB: " + msg);
    }
    init_db();
}

ToolRunStore::~ToolRunStore() {
    if (db_) sqlite3_close(db_);
}

void ToolRunStore::init_db() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS tool_runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            tool TEXT NOT NULL,
            server_id TEXT DEFAULT '',
            arguments TEXT DEFAULT '{}',
            output TEXT DEFAULT '',
            is_error INTEGER DEFAULT 0,
            created_at INTEGER DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_tool_runs_created ON tool_runs(created_at);
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to init tool-run DB: " + msg);
    }
}

bool ToolRunStore::record(const ToolRun& run) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql = "INSERT INTO tool_runs (tool, server_id, arguments, output, is_error, created_at) VALUES (?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[warn] Failed to record tool run: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    sqlite3_bind_text(stmt, 1, run.tool.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, run.server_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, run.arguments.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, run.output.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, run.is_error ? 1 : 0);
    sqlite3_bind_int64(stmt, 6, run.created_at);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "[warn] Failed to record tool run: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

std::vector<ToolRun> ToolRunStore::recent(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolRun> runs;
    const char* sql = "SELECT id, tool, server_id, arguments, output, is_error, created_at FROM tool_runs ORDER BY id DESC LIMIT ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) return runs;
    sqlite3_bind_int(stmt, 1, limit);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ToolRun r;
        r.id = sqlite3_column_int64(stmt, 0);
        r.tool = column_text(stmt, 1);
        r.server_id = column_text(stmt, 2);
        r.arguments = column_text(stmt, 3);
        r.output = column_text(stmt, 4);
        r.is_error = sqlite3_column_int(stmt, 5) != 0;
        r.created_at = sqlite3_column_int64(stmt, 6);
        runs.push_back(std::move(r));
    }
    sqlite3_finalize(stmt);
    return runs;
}

int64_t ToolRunStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql = "SELECT COUNT(*) FROM tool_runs";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) return 0;
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) n = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return n;
}

} // namespace toolchat
