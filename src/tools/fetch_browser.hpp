#pragma once
#include "browser_tool.hpp"
#include <string>
#include <mutex>

namespace toolchat {

// Minimal engine for the command line: navigate fetches the page over HTTP,
// extract returns the whole page text. Selectors, page interaction and
// screenshots are not supported.
class FetchBrowserEngine : public BrowserEngine {
public:
    nlohmann::json execute(const BrowserCommand& cmd) override;
    bool supports(const BrowserCommand& cmd) const override;

    const std::string& current_url() const { return url_; }

private:
    std::mutex mutex_;
    std::string url_;
    std::string body_;
};

// Strips tags, scripts and styles; collapses whitespace.
std::string html_to_text(const std::string& html);
std::string html_title(const std::string& html);

} // namespace toolchat
