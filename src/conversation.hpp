#pragma once
#include "provider.hpp"
#include "tool_dispatch.hpp"
#include "tool_call_scanner.hpp"
#include "message.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>

namespace toolchat {

class ToolRegistry;
class McpManager;

using ChunkCallback = std::function<void(const std::string& text)>;
using ToolResultCallback = std::function<void(const ParsedToolCall& call, const ToolOutcome& outcome)>;

struct TurnSummary {
    std::string pre_tool_text;            // visible text of the first stream
    std::string final_text;               // continuation after the tool result
    std::optional<ParsedToolCall> tool_call;
    std::optional<ToolOutcome> tool_result;
    // Messages to append to the history: user, assistant, [tool, assistant]
    std::vector<Message> transcript;

    std::string assistant_text() const;
};

// Lists every local tool and every cached server tool in namespaced form,
// followed by the toolcall block format.
std::string build_tool_prompt(const ToolRegistry& local, McpManager& mcp);

// Two-phase turn: stream until a tool call (or the end), dispatch it, then
// stream the continuation with the tool result appended.
class ToolConversation {
public:
    enum class Phase { build_request, stream_first, dispatch, stream_continuation, done };

    ToolConversation(ChatProvider& provider, ToolDispatcher& dispatcher,
                     std::string system_prompt, ChatOptions opts);

    // Provider failures propagate as std::runtime_error; tool failures do not.
    TurnSummary stream_with_tools(const std::string& user_text,
                                  const std::vector<Message>& history,
                                  const ChunkCallback& on_chunk,
                                  const ToolResultCallback& on_tool_result);

    Phase phase() const { return phase_; }
    std::string system_prompt() const;

    ChatOptions& options() { return opts_; }

private:
    ChatProvider& provider_;
    ToolDispatcher& dispatcher_;
    std::string system_prompt_;
    ChatOptions opts_;
    Phase phase_ = Phase::done;
};

} // namespace toolchat
