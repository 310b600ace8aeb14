#pragma once
#include "config.hpp"
#include "message.hpp"
#include <string>
#include <vector>
#include <functional>
#include <stdexcept>

namespace toolchat {

struct ChatOptions {
    std::string model;
    double temperature = 0.7;
    int max_tokens = 2048;

    static ChatOptions from_config(const ProviderConfig& cfg) {
        return {cfg.model, cfg.temperature, cfg.max_tokens};
    }
};

// Receives each text fragment as it arrives. Returning false cancels the
// stream; the provider then returns normally.
using TokenCallback = std::function<bool(const std::string& delta)>;

class ChatProvider {
public:
    virtual ~ChatProvider() = default;

    // Blocks until the stream ends or is cancelled.
    // Throws std::runtime_error on transport or HTTP failure.
    virtual void chat_stream(const std::vector<Message>& messages,
                             const ChatOptions& opts,
                             const TokenCallback& on_delta) = 0;

    virtual std::string name() const = 0;
};

// Ollama /api/chat: newline-delimited JSON objects carrying message.content.
class OllamaProvider : public ChatProvider {
public:
    explicit OllamaProvider(const ProviderConfig& cfg);

    void chat_stream(const std::vector<Message>& messages,
                     const ChatOptions& opts,
                     const TokenCallback& on_delta) override;

    std::string name() const override { return "ollama"; }

    const ProviderConfig& config() const { return config_; }

private:
    ProviderConfig config_;
    // Cached URL components (parsed once in constructor)
    std::string scheme_;
    std::string host_;
    int port_;
    std::string path_prefix_;
    std::string base_url_;  // scheme://host:port
};

} // namespace toolchat
