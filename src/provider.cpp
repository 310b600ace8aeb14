#include "provider.hpp"
#include <httplib.h>
#include <iostream>

namespace toolchat {

static void parse_url(const std::string& url, std::string& scheme, std::string& host, int& port, std::string& path_prefix) {
    scheme = "http";
    host = "127.0.0.1";
    port = 80;
    path_prefix = "";

    size_t pos = 0;
    if (url.substr(0, 8) == "https://") {
        scheme = "https"; pos = 8; port = 443;
    } else if (url.substr(0, 7) == "http://") {
        scheme = "http"; pos = 7; port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        path_prefix = url.substr(slash);
        while (!path_prefix.empty() && path_prefix.back() == '/') path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host = host_port.substr(0, colon);
        try {
            port = std::stoi(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid port in provider URL: " + url);
        }
    } else {
        host = host_port;
    }
}

OllamaProvider::OllamaProvider(const ProviderConfig& cfg) : config_(cfg) {
    parse_url(config_.api_base, scheme_, host_, port_, path_prefix_);
    base_url_ = scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

void OllamaProvider::chat_stream(const std::vector<Message>& messages,
                                 const ChatOptions& opts,
                                 const TokenCallback& on_delta) {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(10);
    cli.set_read_timeout(300);

    nlohmann::json body;
    body["model"] = opts.model.empty() ? config_.model : opts.model;
    body["stream"] = true;
    body["options"] = {
        {"temperature", opts.temperature},
        {"num_predict", opts.max_tokens}
    };
    auto& msgs = body["messages"];
    msgs = nlohmann::json::array();
    for (auto& m : messages) {
        msgs.push_back(m.to_json());
    }

    int status = 0;
    bool cancelled = false;
    bool finished = false;
    std::string stream_error;
    std::string error_body;
    std::string line_buf;

    // One NDJSON line: {"message":{"content":"..."},"done":false}
    auto handle_line = [&](const std::string& line) -> bool {
        if (line.empty() || line == "\r") return true;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "[provider] Skipping malformed stream line\n";
            return true;
        }
        if (j.contains("error")) {
            stream_error = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
            return false;
        }
        if (j.contains("message") && j["message"].is_object()) {
            auto& msg = j["message"];
            if (msg.contains("content") && msg["content"].is_string()) {
                std::string token = msg["content"].get<std::string>();
                if (!token.empty() && !on_delta(token)) {
                    cancelled = true;
                    return false;
                }
            }
        }
        if (j.value("done", false)) {
            finished = true;
            return false;
        }
        return true;
    };

    httplib::Request req;
    req.method = "POST";
    req.path = path_prefix_ + "/api/chat";
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "application/x-ndjson");
    req.body = body.dump();
    req.response_handler = [&](const httplib::Response& r) {
        status = r.status;
        return true;
    };
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        if (status != 200) {
            error_body.append(data, len);
            return true;
        }
        line_buf.append(data, len);
        size_t pos;
        while ((pos = line_buf.find('\n')) != std::string::npos) {
            std::string line = line_buf.substr(0, pos);
            line_buf.erase(0, pos + 1);
            if (!handle_line(line)) return false;
        }
        return true;
    };

    httplib::Response res;
    httplib::Error err = httplib::Error::Success;
    bool ok = cli.send(req, res, err);

    if (!stream_error.empty()) {
        throw std::runtime_error("Provider stream error: " + stream_error);
    }
    if (cancelled || finished) return;
    if (!ok) {
        throw std::runtime_error("Provider stream request failed: " + httplib::to_string(err));
    }
    if (status != 200) {
        throw std::runtime_error("Provider stream returned status " + std::to_string(status) +
                                 (error_body.empty() ? "" : ": " + error_body));
    }

    // Final line without a trailing newline
    if (!line_buf.empty()) {
        handle_line(line_buf);
        if (!stream_error.empty()) {
            throw std::runtime_error("Provider stream error: " + stream_error);
        }
    }
}

} // namespace toolchat
