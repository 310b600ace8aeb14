#include "tool_call_scanner.hpp"
#include "utils.hpp"
#include <iostream>
#include <cstring>
#include <cctype>
#include <algorithm>

namespace toolchat {

std::optional<ParsedToolCall> parse_tool_call_json(const std::string& payload) {
    auto j = nlohmann::json::parse(trim(payload), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    if (!j.contains("name") || !j["name"].is_string()) return std::nullopt;

    ParsedToolCall call;
    call.name = trim(j["name"].get<std::string>());
    if (call.name.empty()) return std::nullopt;

    call.arguments = nlohmann::json::object();
    if (j.contains("arguments")) {
        auto& args = j["arguments"];
        if (args.is_object()) {
            call.arguments = args;
        } else if (args.is_string()) {
            // Some models double-encode the arguments
            auto inner = nlohmann::json::parse(args.get<std::string>(), nullptr, false);
            if (!inner.is_discarded() && inner.is_object()) call.arguments = inner;
        } else if (!args.is_null()) {
            return std::nullopt;
        }
    }
    return call;
}

ToolCallScanner::ToolCallScanner(TextSink on_text)
    : on_text_(std::move(on_text)) {}

void ToolCallScanner::emit(const std::string& text) {
    if (text.empty()) return;
    forwarded_ += text;
    if (on_text_) on_text_(text);
}

bool ToolCallScanner::feed(const std::string& chunk) {
    if (finished_) return false;
    raw_ += chunk;

    if (state_ == State::done) {
        emit(chunk);
        return false;
    }

    if (state_ == State::in_block) {
        block_ += chunk;
        try_close_block();
    } else {
        pending_ += chunk;
        scan_pending();
    }
    return state_ != State::done;
}

void ToolCallScanner::scan_pending() {
    static const size_t start_len = std::strlen(kStartSentinel);

    size_t pos = pending_.find(kStartSentinel);
    if (pos != std::string::npos) {
        size_t text_end = pos;
        while (text_end > 0 && std::isspace(static_cast<unsigned char>(pending_[text_end - 1]))) {
            text_end--;
        }
        emit(pending_.substr(0, text_end));
        held_ws_ = pending_.substr(text_end, pos - text_end);
        block_ = pending_.substr(pos + start_len);
        pending_.clear();
        state_ = State::in_block;
        try_close_block();
        return;
    }

    // Longest suffix that is a strict prefix of the start sentinel
    size_t partial = 0;
    size_t max_partial = std::min(pending_.size(), start_len - 1);
    for (size_t len = max_partial; len > 0; len--) {
        if (pending_.compare(pending_.size() - len, len, kStartSentinel, len) == 0) {
            partial = len;
            break;
        }
    }

    size_t hold_from = pending_.size() - partial;
    while (hold_from > 0 && std::isspace(static_cast<unsigned char>(pending_[hold_from - 1]))) {
        hold_from--;
    }
    emit(pending_.substr(0, hold_from));
    pending_.erase(0, hold_from);
    state_ = partial > 0 ? State::matching_start : State::scanning;
}

void ToolCallScanner::try_close_block() {
    static const size_t end_len = std::strlen(kEndSentinel);

    size_t nl = block_.find('\n');
    if (nl == std::string::npos) return;
    size_t end = block_.find(kEndSentinel, nl + 1);
    if (end == std::string::npos) return;

    std::string payload = block_.substr(nl + 1, end - nl - 1);
    std::string after = block_.substr(end + end_len);

    auto call = parse_tool_call_json(payload);
    if (call) {
        call_ = std::move(call);
        call_offset_ = forwarded_.size();
        block_.clear();
        held_ws_.clear();
        state_ = State::done;
        emit(after);
        return;
    }

    std::cerr << "[scanner] Tool-call block is not a valid call, showing it as text\n";
    emit(held_ws_ + kStartSentinel + block_.substr(0, end + end_len));
    held_ws_.clear();
    block_.clear();
    pending_ = after;
    state_ = State::scanning;
    scan_pending();
}

void ToolCallScanner::finish() {
    switch (state_) {
        case State::scanning:
        case State::matching_start:
            emit(pending_);
            pending_.clear();
            break;
        case State::in_block:
            std::cerr << "[scanner] Stream ended inside a tool-call block, dropping "
                      << block_.size() << " byte(s)\n";
            block_.clear();
            held_ws_.clear();
            break;
        case State::done:
            break;
    }
    state_ = State::done;
    finished_ = true;
}

std::string ToolCallScanner::text_before_call() const {
    if (!call_) return forwarded_;
    return forwarded_.substr(0, call_offset_);
}

ExtractedToolCall extract_tool_call(const std::string& response) {
    ExtractedToolCall out;
    ToolCallScanner scanner([&out](const std::string& text) { out.text += text; });
    scanner.feed(response);
    scanner.finish();
    out.call = scanner.tool_call();
    return out;
}

} // namespace toolchat
