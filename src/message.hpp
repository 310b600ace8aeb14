#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolchat {

struct Message {
    std::string role;       // "system", "user", "assistant", "tool"
    std::string content;

    nlohmann::json to_json() const {
        return {{"role", role}, {"content", content}};
    }

    static Message from_json(const nlohmann::json& j) {
        Message m;
        m.role = j.value("role", "");
        m.content = j.value("content", "");
        return m;
    }

    static Message system(std::string text) { return {"system", std::move(text)}; }
    static Message user(std::string text) { return {"user", std::move(text)}; }
    static Message assistant(std::string text) { return {"assistant", std::move(text)}; }
    static Message tool(std::string text) { return {"tool", std::move(text)}; }
};

} // namespace toolchat
