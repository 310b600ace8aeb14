#pragma once
#include "../tool_registry.hpp"
#include "../config.hpp"
#include <string>
#include <vector>

namespace toolchat {

// Runs argv, returns its stdout as base64. Throws std::runtime_error when the
// command cannot start, exits non-zero or prints nothing.
std::string capture_screenshot(const std::vector<std::string>& argv, int timeout_ms = 15000);

void register_screenshot_tool(ToolRegistry& reg, const Config& cfg);

} // namespace toolchat
