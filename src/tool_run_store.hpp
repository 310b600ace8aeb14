#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <sqlite3.h>

namespace toolchat {

struct ToolRun {
    int64_t id = 0;
    std::string tool;           // namespaced name as the model wrote it
    std::string server_id;      // "local" for built-ins, empty when unresolved
    std::string arguments;      // JSON text
    std::string output;
    bool is_error = false;
    int64_t created_at = 0;
};

// SQLite log of every dispatched tool call.
class ToolRunStore {
public:
    // Throws std::runtime_error when the database cannot be opened.
    explicit ToolRunStore(const std::string& db_path);
    ~ToolRunStore();

    ToolRunStore(const ToolRunStore&) = delete;
    ToolRunStore& operator=(const ToolRunStore&) = delete;

    // Logs and returns false on failure.
    bool record(const ToolRun& run);
    // Newest first.
    std::vector<ToolRun> recent(int limit);
    int64_t count();

private:
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
    void init_db();
};

} // namespace toolchat
