#include <gtest/gtest.h>
#include "tool_run_store.hpp"
#include <filesystem>
#include <unistd.h>

using namespace toolchat;

class ToolRunStoreTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("toolchat_runs_" + std::to_string(getpid()));
        std::filesystem::remove_all(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    static ToolRun make_run(const std::string& tool, bool is_error = false) {
        ToolRun r;
        r.tool = tool;
        r.server_id = "srv";
        r.arguments = "{}";
        r.output = "out:" + tool;
        r.is_error = is_error;
        r.created_at = 1700000000;
        return r;
    }
};

TEST_F(ToolRunStoreTest, RecentIsNewestFirst) {
    ToolRunStore store(":memory:");
    EXPECT_TRUE(store.record(make_run("a::one")));
    EXPECT_TRUE(store.record(make_run("a::two", true)));
    EXPECT_TRUE(store.record(make_run("a::three")));

    EXPECT_EQ(store.count(), 3);

    auto recent = store.recent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].tool, "a::three");
    EXPECT_EQ(recent[1].tool, "a::two");
    EXPECT_TRUE(recent[1].is_error);
    EXPECT_EQ(recent[1].output, "out:a::two");
    EXPECT_EQ(recent[1].created_at, 1700000000);
    EXPECT_GT(recent[0].id, recent[1].id);
}

TEST_F(ToolRunStoreTest, PersistsAcrossReopen) {
    auto path = (dir / "sub" / "runs.db").string();
    {
        ToolRunStore store(path);
        store.record(make_run("x::y"));
    }
    ToolRunStore reopened(path);
    EXPECT_EQ(reopened.count(), 1);
    EXPECT_EQ(reopened.recent(10)[0].tool, "x::y");
}

TEST_F(ToolRunStoreTest, UnopenablePathThrows) {
    std::filesystem::create_directories(dir);
    // A directory cannot be opened as a database file
    EXPECT_THROW({
        ToolRunStore store(dir.string());
        store.count();
        store.record(make_run("x::y"));
        if (store.count() == 0) throw std::runtime_error("not usable");
    }, std::runtime_error);
}
