#include <gtest/gtest.h>
#include "provider.hpp"
#include <httplib.h>
#include <thread>
#include <mutex>
#include <chrono>
#include <vector>

using namespace toolchat;

class OllamaProviderTest : public ::testing::Test {
protected:
    httplib::Server svr;
    std::thread thread;
    int port = 0;

    std::mutex mutex;
    nlohmann::json last_request;
    std::vector<std::string> lines;     // served as one chunk each
    int status = 200;

    void SetUp() override {
        svr.Post("/api/chat", [this](const httplib::Request& req, httplib::Response& res) {
            std::vector<std::string> out;
            {
                std::lock_guard<std::mutex> lock(mutex);
                last_request = nlohmann::json::parse(req.body, nullptr, false);
                out = lines;
            }
            if (status != 200) {
                res.status = status;
                res.set_content("model not loaded", "text/plain");
                return;
            }
            res.set_chunked_content_provider("application/x-ndjson",
                [out](size_t, httplib::DataSink& sink) {
                    for (auto& l : out) {
                        sink.write(l.data(), l.size());
                    }
                    sink.done();
                    return true;
                });
        });
        port = svr.bind_to_any_port("127.0.0.1");
        thread = std::thread([this] { svr.listen_after_bind(); });
        for (int i = 0; i < 200 && !svr.is_running(); i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void TearDown() override {
        svr.stop();
        if (thread.joinable()) thread.join();
    }

    OllamaProvider provider() {
        ProviderConfig cfg;
        cfg.api_base = "http://127.0.0.1:" + std::to_string(port);
        cfg.model = "test-model";
        return OllamaProvider(cfg);
    }

    static std::string token(const std::string& text, bool done = false) {
        return nlohmann::json{{"message", {{"role", "assistant"}, {"content", text}}},
                              {"done", done}}.dump() + "\n";
    }
};

TEST_F(OllamaProviderTest, StreamsContentInOrder) {
    lines = {token("Hel"), token("lo"), token("", true)};
    auto p = provider();

    std::string got;
    int calls = 0;
    ChatOptions opts;
    opts.temperature = 0.1;
    opts.max_tokens = 64;
    p.chat_stream({Message::system("sys"), Message::user("hi")}, opts,
                  [&](const std::string& delta) {
                      got += delta;
                      calls++;
                      return true;
                  });

    EXPECT_EQ(got, "Hello");
    EXPECT_EQ(calls, 2);

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(last_request["model"], "test-model");
    EXPECT_EQ(last_request["stream"], true);
    EXPECT_EQ(last_request["options"]["num_predict"], 64);
    ASSERT_EQ(last_request["messages"].size(), 2u);
    EXPECT_EQ(last_request["messages"][1]["role"], "user");
    EXPECT_EQ(last_request["messages"][1]["content"], "hi");
}

TEST_F(OllamaProviderTest, LinesSplitAcrossChunks) {
    std::string a = token("one");
    std::string b = token("two", true);
    std::string joined = a + b;
    lines = {joined.substr(0, 7), joined.substr(7, 20), joined.substr(27)};
    auto p = provider();

    std::string got;
    p.chat_stream({Message::user("x")}, ChatOptions{}, [&](const std::string& d) {
        got += d;
        return true;
    });
    EXPECT_EQ(got, "onetwo");
}

TEST_F(OllamaProviderTest, ModelOverride) {
    lines = {token("ok", true)};
    auto p = provider();
    ChatOptions opts;
    opts.model = "other";
    p.chat_stream({Message::user("x")}, opts, [](const std::string&) { return true; });

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(last_request["model"], "other");
}

TEST_F(OllamaProviderTest, CallbackCancelsStream) {
    lines = {token("first"), token("second"), token("third"), token("", true)};
    auto p = provider();

    std::vector<std::string> got;
    EXPECT_NO_THROW(p.chat_stream({Message::user("x")}, ChatOptions{},
                                  [&](const std::string& d) {
                                      got.push_back(d);
                                      return false;
                                  }));
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], "first");
}

TEST_F(OllamaProviderTest, ErrorLineThrows) {
    lines = {token("partial"), nlohmann::json{{"error", "out of memory"}}.dump() + "\n"};
    auto p = provider();

    try {
        p.chat_stream({Message::user("x")}, ChatOptions{}, [](const std::string&) { return true; });
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("out of memory"), std::string::npos);
    }
}

TEST_F(OllamaProviderTest, HttpErrorStatusThrows) {
    status = 500;
    auto p = provider();

    try {
        p.chat_stream({Message::user("x")}, ChatOptions{}, [](const std::string&) { return true; });
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("500"), std::string::npos);
    }
}

TEST(OllamaProviderFailure, UnreachableHostThrows) {
    ProviderConfig cfg;
    cfg.api_base = "http://127.0.0.1:1";
    OllamaProvider p(cfg);
    EXPECT_THROW(p.chat_stream({Message::user("x")}, ChatOptions{},
                               [](const std::string&) { return true; }),
                 std::runtime_error);
}

TEST(OllamaProviderFailure, RejectsBadPort) {
    ProviderConfig cfg;
    cfg.api_base = "http://localhost:abc";
    EXPECT_THROW(OllamaProvider p(cfg), std::runtime_error);
}
