#pragma once
#include <string>

namespace toolchat {

// Interactive chat when message is empty, otherwise a single turn.
int cmd_chat(const std::string& config_path, const std::string& message,
             const std::string& model_override);

} // namespace toolchat
