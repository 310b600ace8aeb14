#include "fetch_browser.hpp"
#include "../utils.hpp"
#include <httplib.h>
#include <stdexcept>
#include <cctype>

namespace toolchat {

static constexpr size_t kMaxExtractChars = 20000;

static size_t find_ci(const std::string& haystack, const std::string& needle, size_t from) {
    std::string lower = to_lower(haystack);
    return lower.find(needle, from);
}

std::string html_title(const std::string& html) {
    size_t open = find_ci(html, "<title", 0);
    if (open == std::string::npos) return "";
    size_t start = html.find('>', open);
    if (start == std::string::npos) return "";
    size_t end = find_ci(html, "</title>", start);
    if (end == std::string::npos) return "";
    return trim(html.substr(start + 1, end - start - 1));
}

std::string html_to_text(const std::string& html) {
    std::string lower = to_lower(html);
    std::string text;
    text.reserve(html.size() / 2);

    size_t i = 0;
    while (i < html.size()) {
        char c = html[i];
        if (c == '<') {
            // Skip script/style bodies entirely
            for (const char* tag : {"script", "style"}) {
                std::string open = std::string("<") + tag;
                if (lower.compare(i, open.size(), open) == 0) {
                    size_t close = lower.find(std::string("</") + tag, i);
                    i = close == std::string::npos ? html.size() : close;
                    break;
                }
            }
            size_t end = html.find('>', i);
            i = end == std::string::npos ? html.size() : end + 1;
            text += ' ';
            continue;
        }
        if (c == '&') {
            size_t semi = html.find(';', i);
            if (semi != std::string::npos && semi - i <= 6) {
                std::string entity = html.substr(i, semi - i + 1);
                const char* decoded = nullptr;
                if (entity == "&amp;") decoded = "&";
                else if (entity == "&lt;") decoded = "<";
                else if (entity == "&gt;") decoded = ">";
                else if (entity == "&quot;") decoded = "\"";
                else if (entity == "&#39;") decoded = "'";
                else if (entity == "&nbsp;") decoded = " ";
                if (decoded) {
                    text += decoded;
                    i = semi + 1;
                    continue;
                }
            }
        }
        text += c;
        i++;
    }

    // Collapse whitespace
    std::string out;
    out.reserve(text.size());
    bool space = false;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            space = true;
            continue;
        }
        if (space && !out.empty()) out += ' ';
        space = false;
        out += ch;
    }
    return out;
}

bool FetchBrowserEngine::supports(const BrowserCommand& cmd) const {
    switch (cmd.action) {
        case BrowserCommand::Action::navigate: return true;
        case BrowserCommand::Action::extract: return cmd.selector.empty();
        default: return false;
    }
}

nlohmann::json FetchBrowserEngine::execute(const BrowserCommand& cmd) {
    if (!supports(cmd)) {
        throw std::runtime_error("Browser action not supported here: " + cmd.describe());
    }
    std::lock_guard<std::mutex> lock(mutex_);

    switch (cmd.action) {
        case BrowserCommand::Action::navigate: {
            size_t scheme_end = cmd.url.find("://");
            if (scheme_end == std::string::npos) {
                throw std::runtime_error("URL must include a scheme: " + cmd.url);
            }
            size_t path_start = cmd.url.find('/', scheme_end + 3);
            std::string base = path_start == std::string::npos ? cmd.url : cmd.url.substr(0, path_start);
            std::string path = path_start == std::string::npos ? "/" : cmd.url.substr(path_start);

            httplib::Client cli(base);
            cli.set_connection_timeout(10);
            cli.set_read_timeout(30);
            cli.set_follow_location(true);
            auto res = cli.Get(path);
            if (!res) {
                throw std::runtime_error("Failed to load " + cmd.url + ": " + httplib::to_string(res.error()));
            }
            url_ = cmd.url;
            body_ = res->body;
            return {
                {"url", url_},
                {"status", res->status},
                {"title", html_title(body_)}
            };
        }
        case BrowserCommand::Action::extract: {
            if (url_.empty()) throw std::runtime_error("No page loaded");
            std::string text = html_to_text(body_);
            if (text.size() > kMaxExtractChars) {
                text = text.substr(0, kMaxExtractChars) + "...[truncated]";
            }
            return text;
        }
        default:
            break;
    }
    throw std::runtime_error(std::string("Action '") + to_string(cmd.action) +
                             "' needs an interactive browser");
}

} // namespace toolchat
