#pragma once
#include "../tool_registry.hpp"
#include "../confirmation.hpp"
#include <string>
#include <memory>
#include <nlohmann/json.hpp>

namespace toolchat {

struct BrowserCommand {
    enum class Action { navigate, click, type, extract, screenshot };

    Action action = Action::navigate;
    std::string url;
    std::string selector;
    std::string value;
    bool clear = false;
    std::string path;

    // Throws std::invalid_argument on an unknown action or a missing field.
    static BrowserCommand from_json(const nlohmann::json& args);
    std::string describe() const;
    bool sensitive() const { return action == Action::click || action == Action::type; }
};

const char* to_string(BrowserCommand::Action action);

// The automation engine that drives a real page.
class BrowserEngine {
public:
    virtual ~BrowserEngine() = default;
    // Returns a string or a JSON object describing the result; throws on failure.
    virtual nlohmann::json execute(const BrowserCommand& cmd) = 0;
    // Checked before the user is asked to confirm anything.
    virtual bool supports(const BrowserCommand&) const { return true; }
};

void register_browser_tool(ToolRegistry& reg, std::shared_ptr<BrowserEngine> engine,
                           ConfirmationGate& gate);

} // namespace toolchat
