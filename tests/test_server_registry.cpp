#include <gtest/gtest.h>
#include "server_registry.hpp"

using namespace toolchat;

class ServerRegistryTest : public ::testing::Test {
protected:
    ServerRegistry registry;

    static ServerDefinition def(const std::string& id, const std::string& command = "srv") {
        ServerDefinition d;
        d.id = id;
        d.command = command;
        return d;
    }
};

TEST_F(ServerRegistryTest, AddAndFind) {
    registry.add(def("github"), true);
    auto found = registry.find("github");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->command, "srv");
    EXPECT_EQ(found->name, "github");
    EXPECT_TRUE(registry.is_enabled("github"));
    EXPECT_EQ(registry.find("missing"), nullptr);
}

TEST_F(ServerRegistryTest, RejectsDuplicateAndEmptyIds) {
    registry.add(def("github"));
    EXPECT_THROW(registry.add(def("github")), std::invalid_argument);
    EXPECT_THROW(registry.add(def("")), std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ServerRegistryTest, UpdateKeepsEnabledFlag) {
    registry.add(def("github", "old"), true);
    auto before = registry.find("github");

    EXPECT_TRUE(registry.update(def("github", "new")));
    EXPECT_TRUE(registry.is_enabled("github"));
    EXPECT_EQ(registry.find("github")->command, "new");
    // Holders of the old record keep a consistent snapshot
    EXPECT_EQ(before->command, "old");

    EXPECT_FALSE(registry.update(def("unknown")));
}

TEST_F(ServerRegistryTest, EnabledListFollowsFlags) {
    registry.add(def("zeta"), true);
    registry.add(def("alpha"), true);
    registry.add(def("mid"), false);

    auto enabled = registry.enabled();
    ASSERT_EQ(enabled.size(), 2u);
    EXPECT_EQ(enabled[0].id, "alpha");
    EXPECT_EQ(enabled[1].id, "zeta");

    registry.set_enabled("zeta", false);
    registry.set_enabled("mid", true);
    registry.set_enabled("unknown", true);
    enabled = registry.enabled();
    ASSERT_EQ(enabled.size(), 2u);
    EXPECT_EQ(enabled[0].id, "alpha");
    EXPECT_EQ(enabled[1].id, "mid");
    EXPECT_FALSE(registry.is_enabled("unknown"));
}

TEST_F(ServerRegistryTest, RemoveForgetsServer) {
    registry.add(def("github"), true);
    EXPECT_TRUE(registry.remove("github"));
    EXPECT_FALSE(registry.remove("github"));
    EXPECT_FALSE(registry.is_enabled("github"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ServerRegistryTest, DefinitionJson) {
    auto j = nlohmann::json::parse(R"({
        "name": "GitHub",
        "command": "npx",
        "args": ["-y", "server-github"],
        "env": {"TOKEN": "abc"},
        "working_dir": "/tmp"
    })");
    auto d = ServerDefinition::from_json("github", j);
    EXPECT_EQ(d.id, "github");
    EXPECT_EQ(d.name, "GitHub");
    ASSERT_EQ(d.args.size(), 2u);
    EXPECT_EQ(d.args[1], "server-github");
    EXPECT_EQ(d.env.at("TOKEN"), "abc");
    EXPECT_EQ(d.working_dir, "/tmp");

    auto out = d.to_json();
    EXPECT_EQ(out["command"], "npx");
    EXPECT_EQ(out["env"]["TOKEN"], "abc");
    EXPECT_FALSE(out.contains("description"));

    auto bare = ServerDefinition::from_json("x", {{"command", "srv"}});
    EXPECT_EQ(bare.name, "x");
}
