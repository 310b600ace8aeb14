#pragma once
#include "config.hpp"
#include "mcp_manager.hpp"
#include "tool_dispatch.hpp"
#include "confirmation.hpp"
#include <string>

namespace toolchat {

McpOptions make_mcp_options(const Config& cfg);
ResultLimits make_result_limits(const Config& cfg);

// Asks y/N on the terminal for every confirmation request.
void prompt_on_terminal(ConfirmationGate& gate);

int cmd_servers(const std::string& config_path);
int cmd_test(const std::string& config_path, const std::string& server_id);
int cmd_call(const std::string& config_path, const std::string& server_id,
             const std::string& tool, const std::string& args_json);
int cmd_runs(const std::string& config_path, int limit);

} // namespace toolchat
