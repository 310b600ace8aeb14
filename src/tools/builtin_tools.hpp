#pragma once
#include "../tool_registry.hpp"
#include "../config.hpp"
#include "../confirmation.hpp"
#include "browser_tool.hpp"
#include <memory>

namespace toolchat {

// Registers local::screenshot and local::browser, then switches off the
// tools named in cfg.disabled_tools. A null engine means FetchBrowserEngine.
void register_builtin_tools(ToolRegistry& reg, const Config& cfg, ConfirmationGate& gate,
                            std::shared_ptr<BrowserEngine> engine = nullptr);

} // namespace toolchat
