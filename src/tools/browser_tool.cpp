#include "browser_tool.hpp"
#include <stdexcept>

namespace toolchat {

const char* to_string(BrowserCommand::Action action) {
    switch (action) {
        case BrowserCommand::Action::navigate: return "navigate";
        case BrowserCommand::Action::click: return "click";
        case BrowserCommand::Action::type: return "type";
        case BrowserCommand::Action::extract: return "extract";
        case BrowserCommand::Action::screenshot: return "screenshot";
    }
    return "unknown";
}

BrowserCommand BrowserCommand::from_json(const nlohmann::json& args) {
    if (!args.is_object()) {
        throw std::invalid_argument("Browser arguments must be an object");
    }

    BrowserCommand cmd;
    std::string action = args.value("action", "");
    cmd.url = args.value("url", "");
    cmd.selector = args.value("selector", "");
    cmd.value = args.value("value", "");
    cmd.clear = args.value("clear", false);
    cmd.path = args.value("path", "");

    if (action == "navigate") {
        cmd.action = Action::navigate;
        if (cmd.url.empty()) throw std::invalid_argument("navigate requires 'url'");
    } else if (action == "click") {
        cmd.action = Action::click;
        if (cmd.selector.empty()) throw std::invalid_argument("click requires 'selector'");
    } else if (action == "type") {
        cmd.action = Action::type;
        if (cmd.selector.empty()) throw std::invalid_argument("type requires 'selector'");
    } else if (action == "extract") {
        cmd.action = Action::extract;
    } else if (action == "screenshot") {
        cmd.action = Action::screenshot;
    } else if (action.empty()) {
        throw std::invalid_argument("Missing 'action'");
    } else {
        throw std::invalid_argument("Unknown browser action: " + action);
    }
    return cmd;
}

std::string BrowserCommand::describe() const {
    switch (action) {
        case Action::navigate: return "Open " + url;
        case Action::click: return "Click " + selector;
        case Action::type: return "Type \"" + value + "\" into " + selector;
        case Action::extract: return selector.empty() ? "Read page text" : "Read text of " + selector;
        case Action::screenshot: return "Capture the page";
    }
    return "";
}

void register_browser_tool(ToolRegistry& reg, std::shared_ptr<BrowserEngine> engine,
                           ConfirmationGate& gate) {
    ToolDef def;
    def.name = "browser";
    def.description = "Control the browser: navigate, click, type, extract text or capture the page. "
                      "Clicking and typing ask the user first.";
    def.parameters = nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "action": {"type": "string", "enum": ["navigate", "click", "type", "extract", "screenshot"]},
            "url": {"type": "string"},
            "selector": {"type": "string"},
            "value": {"type": "string"},
            "clear": {"type": "boolean"},
            "path": {"type": "string"}
        },
        "required": ["action"]
    })JSON");

    ConfirmationGate* gate_ptr = &gate;
    def.func = [engine, gate_ptr](const nlohmann::json& args) -> nlohmann::json {
        if (!engine) {
            throw std::runtime_error("Browser automation is not available");
        }
        auto cmd = BrowserCommand::from_json(args);
        if (!engine->supports(cmd)) {
            throw std::runtime_error("Browser action not supported here: " + cmd.describe());
        }
        if (cmd.sensitive() && !gate_ptr->request(cmd.describe())) {
            throw std::runtime_error("User denied browser action: " + cmd.describe());
        }
        return engine->execute(cmd);
    };

    reg.register_tool(std::move(def));
}

} // namespace toolchat
