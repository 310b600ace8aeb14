#include <gtest/gtest.h>
#include "conversation.hpp"
#include "mcp_manager.hpp"
#include "tools/screenshot_tool.hpp"

using namespace toolchat;

// Replays canned chunk sequences, one per chat_stream call.
class ScriptedProvider : public ChatProvider {
public:
    std::vector<std::vector<std::string>> scripts;
    std::vector<std::vector<Message>> requests;
    std::vector<size_t> delivered;
    bool fail = false;

    void chat_stream(const std::vector<Message>& messages, const ChatOptions&,
                     const TokenCallback& on_delta) override {
        requests.push_back(messages);
        if (fail) throw std::runtime_error("Provider stream request failed: Connection");
        size_t idx = requests.size() - 1;
        ASSERT_LT(idx, scripts.size()) << "unexpected extra request";
        size_t n = 0;
        for (auto& chunk : scripts[idx]) {
            n++;
            if (!on_delta(chunk)) break;
        }
        delivered.push_back(n);
    }

    std::string name() const override { return "scripted"; }
};

class ToolConversationTest : public ::testing::Test {
protected:
    ServerRegistry registry;
    ToolRegistry local;
    ScriptedProvider provider;
    std::unique_ptr<McpManager> mcp;
    std::unique_ptr<ToolDispatcher> dispatcher;
    std::unique_ptr<ToolConversation> convo;

    std::string shown;
    std::vector<ToolOutcome> results;

    void SetUp() override {
        Config cfg;
        cfg.screenshot_command = {"printf", "PNG"};
        register_screenshot_tool(local, cfg);

        McpOptions opts;
        opts.call_timeout_ms = 5000;
        opts.handshake_timeout_ms = 5000;
        opts.stop_grace_ms = 500;
        mcp = std::make_unique<McpManager>(registry, opts);
        dispatcher = std::make_unique<ToolDispatcher>(local, *mcp);
        convo = std::make_unique<ToolConversation>(provider, *dispatcher,
                                                   "You are terse.", ChatOptions{});
    }

    TurnSummary turn(const std::string& text, const std::vector<Message>& history = {}) {
        return convo->stream_with_tools(
            text, history,
            [this](const std::string& chunk) { shown += chunk; },
            [this](const ParsedToolCall&, const ToolOutcome& outcome) { results.push_back(outcome); });
    }
};

TEST_F(ToolConversationTest, PlainReplyUsesOneStream) {
    provider.scripts = {{"Hi", " there"}};
    auto s = turn("hello");

    EXPECT_EQ(shown, "Hi there");
    EXPECT_EQ(provider.requests.size(), 1u);
    EXPECT_FALSE(s.tool_call.has_value());
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(s.assistant_text(), "Hi there");
    ASSERT_EQ(s.transcript.size(), 2u);
    EXPECT_EQ(s.transcript[0].role, "user");
    EXPECT_EQ(s.transcript[1].content, "Hi there");
    EXPECT_EQ(convo->phase(), ToolConversation::Phase::done);
}

TEST_F(ToolConversationTest, FirstRequestCarriesToolsAndHistory) {
    provider.scripts = {{"ok"}};
    turn("again", {Message::user("earlier"), Message::assistant("reply")});

    auto& msgs = provider.requests[0];
    ASSERT_EQ(msgs.size(), 4u);
    EXPECT_EQ(msgs[0].role, "system");
    EXPECT_EQ(msgs[0].content.rfind("You are terse.", 0), 0u);
    EXPECT_NE(msgs[0].content.find("local::screenshot"), std::string::npos);
    EXPECT_NE(msgs[0].content.find("```toolcall"), std::string::npos);
    EXPECT_EQ(msgs[1].content, "earlier");
    EXPECT_EQ(msgs[2].content, "reply");
    EXPECT_EQ(msgs[3].role, "user");
    EXPECT_EQ(msgs[3].content, "again");
}

TEST_F(ToolConversationTest, LocalToolRoundTrip) {
    provider.scripts = {
        {"Taking a look.", " ```tool", "call\n{\"name\":\"local::screenshot\",\"arguments\":{}}\n```",
         "never delivered"},
        {"The screen", " shows a PNG."}
    };
    auto s = turn("What is on my screen?");

    // The first stream stops at the block
    ASSERT_EQ(provider.delivered.size(), 2u);
    EXPECT_EQ(provider.delivered[0], 3u);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].is_error);
    EXPECT_EQ(results[0].output, "UE5H");

    auto& second = provider.requests[1];
    ASSERT_GE(second.size(), 4u);
    EXPECT_EQ(second[second.size() - 3].role, "user");
    EXPECT_EQ(second[second.size() - 2].role, "assistant");
    EXPECT_EQ(second[second.size() - 2].content, "Taking a look.");
    EXPECT_EQ(second.back().role, "tool");
    EXPECT_EQ(second.back().content, "UE5H");

    EXPECT_EQ(shown, "Taking a look.The screen shows a PNG.");
    EXPECT_EQ(s.pre_tool_text, "Taking a look.");
    EXPECT_EQ(s.final_text, "The screen shows a PNG.");
    ASSERT_TRUE(s.tool_call.has_value());
    EXPECT_EQ(s.tool_call->name, "local::screenshot");

    ASSERT_EQ(s.transcript.size(), 4u);
    EXPECT_EQ(s.transcript[2].role, "tool");
    EXPECT_EQ(s.transcript[3].content, "The screen shows a PNG.");
}

TEST_F(ToolConversationTest, TextAfterBlockInSameChunkIsDropped) {
    provider.scripts = {
        {"Let me look. ```toolcall\n{\"name\":\"local::screenshot\",\"arguments\":{}}\n``` It is obviously a cat.",
         "never delivered"},
        {"Final."}
    };
    auto s = turn("What is on my screen?");

    EXPECT_EQ(provider.delivered[0], 1u);
    EXPECT_EQ(shown, "Let me look.Final.");
    EXPECT_EQ(s.pre_tool_text, "Let me look.");

    auto& second = provider.requests[1];
    ASSERT_GE(second.size(), 2u);
    EXPECT_EQ(second[second.size() - 2].role, "assistant");
    EXPECT_EQ(second[second.size() - 2].content, "Let me look.");
    EXPECT_EQ(second.back().content, "UE5H");
    EXPECT_EQ(s.transcript[1].content, "Let me look.");
}

TEST_F(ToolConversationTest, FailedToolStillContinues) {
    provider.scripts = {
        {"```toolcall\n{\"name\":\"slack::post\",\"arguments\":{\"text\":\"hi\"}}\n```"},
        {"I could not reach Slack."}
    };
    auto s = turn("post hi");

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].is_error);
    auto err = nlohmann::json::parse(provider.requests[1].back().content);
    EXPECT_TRUE(err.contains("error"));
    EXPECT_EQ(s.final_text, "I could not reach Slack.");
    EXPECT_EQ(shown, "I could not reach Slack.");
}

TEST_F(ToolConversationTest, OnlyOneToolCallPerTurn) {
    std::string block = "```toolcall\n{\"name\":\"local::screenshot\",\"arguments\":{}}\n```";
    provider.scripts = {{block}, {"Again: ", block}};
    auto s = turn("look twice");

    EXPECT_EQ(provider.requests.size(), 2u);
    EXPECT_EQ(results.size(), 1u);
    EXPECT_EQ(s.final_text, "Again: " + block);
}

TEST_F(ToolConversationTest, ProviderFailurePropagates) {
    provider.fail = true;
    EXPECT_THROW(turn("hello"), std::runtime_error);
    EXPECT_EQ(convo->phase(), ToolConversation::Phase::done);
}

TEST_F(ToolConversationTest, ServerToolIsAdvertisedAndCalled) {
    ServerDefinition def;
    def.id = "alpha";
    def.command = FAKE_MCP_SERVER_PATH;
    def.args = {"echo"};
    registry.add(def);
    mcp->start_server("alpha");

    provider.scripts = {
        {"```toolcall\n{\"name\":\"alpha::echo\",\"arguments\":{\"text\":\"ping\"}}\n```"},
        {"It said ping."}
    };
    turn("echo ping");

    EXPECT_NE(provider.requests[0][0].content.find("alpha::echo"), std::string::npos);
    EXPECT_NE(provider.requests[0][0].content.find("alpha::slow"), std::string::npos);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].target.server_id, "alpha");
    EXPECT_EQ(results[0].output, "ping");
}
