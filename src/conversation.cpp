#include "conversation.hpp"
#include "mcp_manager.hpp"
#include "tool_registry.hpp"
#include <iostream>
#include <sstream>

namespace toolchat {

std::string TurnSummary::assistant_text() const {
    if (final_text.empty()) return pre_tool_text;
    if (pre_tool_text.empty()) return final_text;
    return pre_tool_text + "\n" + final_text;
}

static std::string describe_params(const nlohmann::json& schema) {
    if (!schema.is_object() || !schema.contains("properties") ||
        !schema["properties"].is_object() || schema["properties"].empty()) {
        return "{}";
    }
    return schema["properties"].dump();
}

std::string build_tool_prompt(const ToolRegistry& local, McpManager& mcp) {
    std::ostringstream ss;
    ss << "# Tools\n\n"
       << "You can call one tool per reply. To call a tool, write a fenced block exactly like this:\n\n"
       << "```toolcall\n"
       << "{\"name\": \"<namespace>::<tool>\", \"arguments\": {\"key\": \"value\"}}\n"
       << "```\n\n"
       << "Always use the full namespaced name from the list below. "
       << "Stop writing after the block; the result will be sent back to you.\n\n"
       << "## Available tools\n";

    for (auto& name : local.tool_names()) {
        auto* def = local.find(name);
        if (def && !def->enabled) continue;
        ss << "- " << kLocalNamespace << kNamespaceDelimiter << name;
        if (def && !def->description.empty()) ss << ": " << def->description;
        if (def) ss << " Parameters: " << describe_params(def->parameters);
        ss << "\n";
    }

    for (auto& id : mcp.running_ids()) {
        auto tools = mcp.tools(id);
        if (tools.empty()) {
            ss << "- " << id << kNamespaceDelimiter << "<tool>: tools served by '" << id << "'\n";
            continue;
        }
        for (auto& t : tools) {
            ss << "- " << id << kNamespaceDelimiter << t.name;
            if (!t.description.empty()) ss << ": " << t.description;
            ss << " Parameters: " << describe_params(t.input_schema) << "\n";
        }
    }
    return ss.str();
}

ToolConversation::ToolConversation(ChatProvider& provider, ToolDispatcher& dispatcher,
                                   std::string system_prompt, ChatOptions opts)
    : provider_(provider), dispatcher_(dispatcher),
      system_prompt_(std::move(system_prompt)), opts_(std::move(opts)) {}

std::string ToolConversation::system_prompt() const {
    std::string tools = build_tool_prompt(dispatcher_.local_tools(), dispatcher_.mcp());
    if (system_prompt_.empty()) return tools;
    return system_prompt_ + "\n\n" + tools;
}

TurnSummary ToolConversation::stream_with_tools(const std::string& user_text,
                                                const std::vector<Message>& history,
                                                const ChunkCallback& on_chunk,
                                                const ToolResultCallback& on_tool_result) {
    TurnSummary summary;

    phase_ = Phase::build_request;
    std::vector<Message> messages;
    messages.push_back(Message::system(system_prompt()));
    messages.insert(messages.end(), history.begin(), history.end());
    messages.push_back(Message::user(user_text));
    summary.transcript.push_back(Message::user(user_text));

    phase_ = Phase::stream_first;
    // Text after a detected block is never shown
    ToolCallScanner scanner([&](const std::string& text) {
        if (on_chunk && !scanner.found()) on_chunk(text);
    });
    try {
        provider_.chat_stream(messages, opts_, [&](const std::string& delta) {
            return scanner.feed(delta);
        });
    } catch (...) {
        phase_ = Phase::done;
        throw;
    }
    scanner.finish();
    summary.pre_tool_text = scanner.text_before_call();
    summary.transcript.push_back(Message::assistant(summary.pre_tool_text));

    if (!scanner.found()) {
        phase_ = Phase::done;
        return summary;
    }

    phase_ = Phase::dispatch;
    const ParsedToolCall& call = *scanner.tool_call();
    summary.tool_call = call;
    std::cerr << "[chat] Tool call: " << call.name << "\n";
    ToolOutcome outcome = dispatcher_.dispatch(call);
    summary.tool_result = outcome;
    summary.transcript.push_back(Message::tool(outcome.output));
    if (on_tool_result) on_tool_result(call, outcome);

    phase_ = Phase::stream_continuation;
    messages.push_back(Message::assistant(summary.pre_tool_text));
    messages.push_back(Message::tool(outcome.output));
    try {
        provider_.chat_stream(messages, opts_, [&](const std::string& delta) {
            summary.final_text += delta;
            if (on_chunk) on_chunk(delta);
            return true;
        });
    } catch (...) {
        phase_ = Phase::done;
        throw;
    }
    summary.transcript.push_back(Message::assistant(summary.final_text));

    phase_ = Phase::done;
    return summary;
}

} // namespace toolchat
