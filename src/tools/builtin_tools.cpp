#include "builtin_tools.hpp"
#include "screenshot_tool.hpp"
#include "fetch_browser.hpp"
#include <iostream>

namespace toolchat {

void register_builtin_tools(ToolRegistry& reg, const Config& cfg, ConfirmationGate& gate,
                            std::shared_ptr<BrowserEngine> engine) {
    if (!engine) engine = std::make_shared<FetchBrowserEngine>();

    register_screenshot_tool(reg, cfg);
    register_browser_tool(reg, std::move(engine), gate);

    for (auto& name : cfg.disabled_tools) {
        if (!reg.set_enabled(name, false)) {
            std::cerr << "[config] disabled_tools names unknown tool '" << name << "'\n";
        }
    }
}

} // namespace toolchat
