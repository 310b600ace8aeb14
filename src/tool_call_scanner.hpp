#pragma once
#include <string>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace toolchat {

struct ParsedToolCall {
    std::string name;             // "<namespace>::<tool>"
    nlohmann::json arguments;     // always an object
};

// Incremental detector for a ```toolcall fenced block inside streamed model
// text. Ordinary text is forwarded as soon as it can no longer be the start
// of a sentinel; the block itself is never forwarded. Text after a detected
// block is forwarded unscanned.
class ToolCallScanner {
public:
    enum class State { scanning, matching_start, in_block, done };

    using TextSink = std::function<void(const std::string&)>;

    static constexpr const char* kStartSentinel = "```toolcall";
    static constexpr const char* kEndSentinel = "```";

    explicit ToolCallScanner(TextSink on_text);

    // Returns false once a tool call has been detected; the caller should
    // stop the upstream stream. Chunks fed after finish() are ignored.
    bool feed(const std::string& chunk);

    // End of stream: flushes held text, drops an unterminated block.
    void finish();

    State state() const { return state_; }
    bool found() const { return call_.has_value(); }
    const std::optional<ParsedToolCall>& tool_call() const { return call_; }

    // Everything received, and everything forwarded.
    const std::string& raw_text() const { return raw_; }
    const std::string& forwarded_text() const { return forwarded_; }

    // Forwarded text up to the detected block, or all of it when no call
    // was found.
    std::string text_before_call() const;

private:
    TextSink on_text_;
    State state_ = State::scanning;
    std::string raw_;
    std::string forwarded_;
    std::string pending_;     // text not yet forwarded while scanning
    std::string block_;       // text after the start sentinel
    std::string held_ws_;     // whitespace dropped in front of the sentinel
    std::optional<ParsedToolCall> call_;
    size_t call_offset_ = 0;  // size of forwarded_ when the block was found
    bool finished_ = false;

    void emit(const std::string& text);
    void scan_pending();
    void try_close_block();
};

// Decodes {"name": ..., "arguments": {...}}. Returns nullopt for anything else.
std::optional<ParsedToolCall> parse_tool_call_json(const std::string& payload);

struct ExtractedToolCall {
    std::string text;                       // response with the block removed
    std::optional<ParsedToolCall> call;
};

// Applies the scanner rules to a complete response.
ExtractedToolCall extract_tool_call(const std::string& response);

} // namespace toolchat
