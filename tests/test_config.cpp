#include <gtest/gtest.h>
#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace toolchat;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("toolchat_config_" + std::to_string(getpid()));
        std::filesystem::remove_all(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }
};

TEST_F(ConfigTest, Defaults) {
    Config c;
    EXPECT_EQ(c.tool_timeout_ms, 30000);
    EXPECT_TRUE(c.mcp_handshake);
    EXPECT_TRUE(c.mcp_servers.empty());
    EXPECT_FALSE(c.screenshot_command.empty());
}

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    auto c = Config::load((dir / "nope.json").string());
    EXPECT_EQ(c.provider.model, Config{}.provider.model);
    EXPECT_TRUE(c.mcp_servers.empty());
}

TEST_F(ConfigTest, MalformedFileGivesDefaults) {
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "config.json") << "{ not json";
    auto c = Config::load((dir / "config.json").string());
    EXPECT_EQ(c.tool_timeout_ms, 30000);
}

TEST_F(ConfigTest, SaveAndLoad) {
    Config c;
    c.provider.model = "qwen2.5";
    c.provider.temperature = 0.2;
    c.tool_timeout_ms = 0;
    c.mcp_handshake = false;
    c.screenshot_command = {"grim", "-"};
    McpServerConfig srv;
    srv.definition.command = "npx";
    srv.definition.args = {"-y", "server-github"};
    srv.definition.env = {{"TOKEN", "abc"}};
    srv.enabled = true;
    c.mcp_servers["github"] = srv;

    auto path = (dir / "nested" / "config.json").string();
    c.save(path);
    auto loaded = Config::load(path);

    EXPECT_EQ(loaded.provider.model, "qwen2.5");
    EXPECT_DOUBLE_EQ(loaded.provider.temperature, 0.2);
    EXPECT_EQ(loaded.tool_timeout_ms, 0);
    EXPECT_FALSE(loaded.mcp_handshake);
    EXPECT_EQ(loaded.screenshot_command, (std::vector<std::string>{"grim", "-"}));
    ASSERT_EQ(loaded.mcp_servers.count("github"), 1u);
    auto& gh = loaded.mcp_servers["github"];
    EXPECT_TRUE(gh.enabled);
    EXPECT_EQ(gh.definition.command, "npx");
    EXPECT_EQ(gh.definition.env.at("TOKEN"), "abc");
}

TEST_F(ConfigTest, PartialJsonKeepsOtherDefaults) {
    auto c = Config::from_json({{"provider", {{"model", "mistral"}}}, {"stop_grace_ms", 100}});
    EXPECT_EQ(c.provider.model, "mistral");
    EXPECT_EQ(c.provider.api_base, Config{}.provider.api_base);
    EXPECT_EQ(c.stop_grace_ms, 100);
    EXPECT_EQ(c.handshake_timeout_ms, 10000);
}

TEST_F(ConfigTest, PopulateRegistry) {
    auto c = Config::from_json(nlohmann::json::parse(R"({
        "mcp_servers": {
            "github": {"command": "gh-server", "enabled": true},
            "slack": {"command": "slack-server", "name": "Slack"}
        }
    })"));

    ServerRegistry registry;
    c.populate(registry);

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.is_enabled("github"));
    EXPECT_FALSE(registry.is_enabled("slack"));
    EXPECT_EQ(registry.find("slack")->name, "Slack");
    EXPECT_EQ(registry.find("github")->name, "github");
}

TEST_F(ConfigTest, ResultLimitsAndDisabledTools) {
    Config defaults;
    EXPECT_EQ(defaults.max_tool_result_bytes, 1000000u);
    EXPECT_EQ(defaults.truncated_result_bytes, 500000u);
    EXPECT_TRUE(defaults.disabled_tools.empty());

    auto c = Config::from_json(nlohmann::json::parse(R"({
        "max_tool_result_bytes": 2048,
        "truncated_result_bytes": 1024,
        "disabled_tools": ["browser", 7]
    })"));
    EXPECT_EQ(c.max_tool_result_bytes, 2048u);
    EXPECT_EQ(c.truncated_result_bytes, 1024u);
    EXPECT_EQ(c.disabled_tools, (std::vector<std::string>{"browser"}));

    auto back = Config::from_json(c.to_json());
    EXPECT_EQ(back.disabled_tools, c.disabled_tools);
    EXPECT_EQ(back.max_tool_result_bytes, 2048u);
}
