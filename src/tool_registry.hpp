#pragma once
#include <string>
#include <map>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace toolchat {

// Built-in handlers return a JSON string for plain text results or any
// structured value; they throw to report failure.
using ToolFunction = std::function<nlohmann::json(const nlohmann::json&)>;

struct ToolDef {
    std::string name;
    std::string description;
    nlohmann::json parameters;
    ToolFunction func;
    bool enabled = true;
};

class ToolRegistry {
public:
    void register_tool(ToolDef def) {
        tools_[def.name] = std::move(def);
    }

    bool has(const std::string& name) const {
        return tools_.count(name) > 0;
    }

    nlohmann::json execute(const std::string& name, const nlohmann::json& args) const {
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            throw std::runtime_error("Unknown local tool: " + name);
        }
        return it->second.func(args);
    }

    // Returns false when no tool has that name.
    bool set_enabled(const std::string& name, bool enabled) {
        auto it = tools_.find(name);
        if (it == tools_.end()) return false;
        it->second.enabled = enabled;
        return true;
    }

    bool is_enabled(const std::string& name) const {
        auto it = tools_.find(name);
        return it != tools_.end() && it->second.enabled;
    }

    const ToolDef* find(const std::string& name) const {
        auto it = tools_.find(name);
        return it == tools_.end() ? nullptr : &it->second;
    }

    std::vector<std::string> tool_names() const {
        std::vector<std::string> names;
        for (auto& [n, _] : tools_) names.push_back(n);
        return names;
    }

    size_t size() const { return tools_.size(); }

private:
    std::map<std::string, ToolDef> tools_;
};

} // namespace toolchat
