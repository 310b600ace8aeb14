#pragma once
#include "tool_call_scanner.hpp"
#include "tool_registry.hpp"
#include "server_registry.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace toolchat {

class McpManager;
class ToolRunStore;

constexpr const char* kLocalNamespace = "local";
constexpr const char* kNamespaceDelimiter = "::";

class DispatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DispatchTarget {
    enum class Kind { local, server };
    Kind kind = Kind::local;
    std::string server_id;      // empty for local tools
    std::string tool;           // name without the namespace
};

// Splits "<namespace>::<tool>" and matches the namespace against "local" or
// the id/display name of an enabled server, case-insensitively.
// Throws DispatchError when the name is malformed or nothing matches.
DispatchTarget resolve_tool_target(const std::string& tool_name,
                                   const std::vector<ServerDefinition>& enabled_servers);

struct ToolOutcome {
    DispatchTarget target;
    std::string output;         // text handed back to the model
    bool is_error = false;
};

// Turns a tools/call result into text: joined text items, or pretty JSON.
// Sets is_error when the server flagged the result with isError.
std::string format_tool_result(const nlohmann::json& result, bool& is_error);
std::string format_tool_error(const std::string& message);

struct ResultLimits {
    size_t max_bytes = 1000000;       // outputs above this are truncated
    size_t truncate_to = 500000;      // bytes kept, cut on a UTF-8 boundary
    size_t warn_bytes = 100000;       // outputs above this are logged
};

constexpr const char* kTruncationMarker = "\n\n[... Result truncated due to size ...]";

// Cuts text longer than limits.max_bytes and appends kTruncationMarker.
// Returns true when the text was changed.
bool truncate_tool_output(std::string& text, const ResultLimits& limits);

class ToolDispatcher {
public:
    ToolDispatcher(ToolRegistry& local, McpManager& mcp, ToolRunStore* runs = nullptr,
                   ResultLimits limits = {})
        : local_(local), mcp_(mcp), runs_(runs), limits_(limits) {}

    // Never throws: failures come back as {"error": ...} outcomes.
    ToolOutcome dispatch(const ParsedToolCall& call);

    const ToolRegistry& local_tools() const { return local_; }
    McpManager& mcp() { return mcp_; }

private:
    ToolRegistry& local_;
    McpManager& mcp_;
    ToolRunStore* runs_;
    ResultLimits limits_;

    void invoke(const ParsedToolCall& call, ToolOutcome& out);
};

} // namespace toolchat
