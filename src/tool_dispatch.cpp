#include "tool_dispatch.hpp"
#include "mcp_manager.hpp"
#include "tool_run_store.hpp"
#include "utils.hpp"
#include <iostream>
#include <algorithm>

namespace toolchat {

DispatchTarget resolve_tool_target(const std::string& tool_name,
                                   const std::vector<ServerDefinition>& enabled_servers) {
    size_t pos = tool_name.find(kNamespaceDelimiter);
    if (pos == std::string::npos || pos == 0 ||
        pos + std::string(kNamespaceDelimiter).size() >= tool_name.size()) {
        throw DispatchError("Malformed tool name '" + tool_name +
                            "': expected <namespace>::<tool>");
    }

    std::string ns = to_lower(tool_name.substr(0, pos));
    std::string tool = tool_name.substr(pos + std::string(kNamespaceDelimiter).size());

    DispatchTarget target;
    target.tool = tool;
    if (ns == kLocalNamespace) {
        target.kind = DispatchTarget::Kind::local;
        return target;
    }

    const ServerDefinition* by_id = nullptr;
    std::vector<const ServerDefinition*> by_name;
    for (auto& srv : enabled_servers) {
        if (to_lower(srv.id) == ns) by_id = &srv;
        else if (to_lower(srv.name) == ns) by_name.push_back(&srv);
    }

    const ServerDefinition* match = by_id;
    if (!match) {
        if (by_name.size() > 1) {
            throw DispatchError("Tool name '" + tool_name + "' is ambiguous: " +
                                std::to_string(by_name.size()) + " enabled servers are named '" +
                                tool_name.substr(0, pos) + "'");
        }
        if (by_name.empty()) {
            throw DispatchError("No enabled server matches namespace '" + tool_name.substr(0, pos) +
                                "' in tool name '" + tool_name + "'");
        }
        match = by_name.front();
    }

    target.kind = DispatchTarget::Kind::server;
    target.server_id = match->id;
    return target;
}

static bool is_known_content_type(const std::string& type) {
    static const char* known[] = {"text", "image", "audio", "resource", "resource_link",
                                  "artifact", "error", "json"};
    for (auto* k : known) {
        if (type == k) return true;
    }
    return false;
}

std::string format_tool_result(const nlohmann::json& result, bool& is_error) {
    is_error = false;
    if (result.is_string()) return result.get<std::string>();
    if (!result.is_object()) return result.dump(2);

    if (result.contains("isError") && result["isError"].is_boolean()) {
        is_error = result["isError"].get<bool>();
    }

    if (result.contains("content") && result["content"].is_array()) {
        std::string text;
        bool any = false;
        for (auto& item : result["content"]) {
            if (!item.is_object()) continue;
            std::string type = to_lower(item.value("type", ""));
            if (type != "text") {
                if (!is_known_content_type(type)) {
                    std::cerr << "[dispatch] Ignoring content item of unknown type '" << type << "'\n";
                }
                continue;
            }
            if (any) text += "\n";
            text += item.value("text", "");
            any = true;
        }
        if (any) return text;
    }
    return result.dump(2);
}

std::string format_tool_error(const std::string& message) {
    return nlohmann::json{{"error", message}}.dump(2);
}

bool truncate_tool_output(std::string& text, const ResultLimits& limits) {
    if (text.size() <= limits.max_bytes) return false;
    size_t cut = std::min(limits.truncate_to, text.size());
    // Back up over UTF-8 continuation bytes
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) cut--;
    text.erase(cut);
    text += kTruncationMarker;
    return true;
}

void ToolDispatcher::invoke(const ParsedToolCall& call, ToolOutcome& out) {
    if (out.target.kind == DispatchTarget::Kind::local) {
        if (!local_.has(out.target.tool)) {
            throw DispatchError("Unknown local tool '" + call.name + "'");
        }
        if (!local_.is_enabled(out.target.tool)) {
            throw DispatchError("Local tool '" + call.name + "' is disabled");
        }
        auto result = local_.execute(out.target.tool, call.arguments);
        out.output = result.is_string() ? result.get<std::string>() : result.dump(2);
        return;
    }

    auto result = mcp_.call_tool(out.target.server_id, out.target.tool, call.arguments);
    bool failed = false;
    std::string text = format_tool_result(result, failed);
    if (failed) {
        out.is_error = true;
        out.output = format_tool_error(text);
    } else {
        out.output = text;
    }
}

ToolOutcome ToolDispatcher::dispatch(const ParsedToolCall& call) {
    ToolOutcome out;
    bool resolved = false;
    try {
        out.target = resolve_tool_target(call.name, mcp_.registry().enabled());
        resolved = true;
        invoke(call, out);
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] " << call.name << " failed: " << e.what() << "\n";
        out.is_error = true;
        out.output = format_tool_error(e.what());
    }

    size_t size = out.output.size();
    if (size > limits_.warn_bytes) {
        std::cerr << "[dispatch] " << call.name << " returned " << size << " bytes\n";
    }
    if (truncate_tool_output(out.output, limits_)) {
        std::cerr << "[dispatch] Truncated result of " << call.name << " from " << size
                  << " to " << out.output.size() << " bytes\n";
    }

    if (runs_) {
        ToolRun run;
        run.tool = call.name;
        if (!resolved) run.server_id = "";
        else if (out.target.kind == DispatchTarget::Kind::server) run.server_id = out.target.server_id;
        else run.server_id = kLocalNamespace;
        run.arguments = call.arguments.dump();
        run.output = out.output;
        run.is_error = out.is_error;
        run.created_at = epoch_now();
        runs_->record(run);
    }
    return out;
}

} // namespace toolchat
