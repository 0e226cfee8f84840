#include <gtest/gtest.h>

#include "hotupdate/state_store.hpp"
#include "testing.hpp"

#include <filesystem>

namespace hotupdate {
namespace {

namespace fs = std::filesystem;

class JsonFileStateStoreTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory tmp;
    std::string path = tmp.Path() + "/state/hot_updates_state.json";
};

TEST_F(JsonFileStateStoreTest, MissingFileYieldsBundleState) {
    JsonFileStateStore store(path, "1.0.0");
    UpdateState s;
    auto r = store.Load(s);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(s.meta.installed_version, "1.0.0");
    EXPECT_EQ(s.meta.version_history, std::vector<std::string>{"1.0.0"});
}

TEST_F(JsonFileStateStoreTest, SaveThenLoadPreservesRecord) {
    JsonFileStateStore store(path, "1.0.0");
    auto s = UpdateState::Initial("1.0.0");
    s.meta.installed_version = "1.1.0";
    s.meta.previous_version = "1.0.0";
    s.AddToHistory("1.1.0");
    s.AddIgnored("1.0.5");
    s.phase = phase::CanaryPending{"1.1.0"};
    ASSERT_TRUE(store.Save(s).is_ok());

    UpdateState loaded;
    ASSERT_TRUE(store.Load(loaded).is_ok());
    EXPECT_EQ(EncodeState(loaded), EncodeState(s));
}

TEST_F(JsonFileStateStoreTest, MalformedFileFallsBackToDefault) {
    ASSERT_TRUE(testutil::WriteTextFile(path, "{\"hot_updates_installed_version\": "));
    JsonFileStateStore store(path, "1.0.0");
    UpdateState s;
    auto r = store.Load(s);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.code, ErrorCode::StateIoError);
    EXPECT_EQ(s.meta.installed_version, "1.0.0");
}

TEST_F(JsonFileStateStoreTest, LeftoverTempFileIsIgnored) {
    JsonFileStateStore store(path, "1.0.0");
    auto s = UpdateState::Initial("1.0.0");
    s.phase = phase::Staged{"1.1.0"};
    ASSERT_TRUE(store.Save(s).is_ok());

    // What a crash in the middle of the next save leaves behind.
    const std::string torn = fs::path(path).parent_path().string() + "/.hot_updates_state.json.tmp-abc123";
    ASSERT_TRUE(testutil::WriteTextFile(torn, "{\"hot_updates_installed_ver"));

    UpdateState loaded;
    ASSERT_TRUE(store.Load(loaded).is_ok());
    EXPECT_EQ(loaded.PendingVersion(), "1.1.0");
}

TEST_F(JsonFileStateStoreTest, SaveLeavesNoTempFiles) {
    JsonFileStateStore store(path, "1.0.0");
    ASSERT_TRUE(store.Save(UpdateState::Initial("1.0.0")).is_ok());
    ASSERT_TRUE(store.Save(UpdateState::Initial("1.0.0")).is_ok());

    int entries = 0;
    for (const auto& e : fs::directory_iterator(fs::path(path).parent_path())) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1);
}

TEST_F(JsonFileStateStoreTest, LoadHealsInvariantViolations) {
    ASSERT_TRUE(testutil::WriteTextFile(path, R"({
        "hot_updates_installed_version": "2.0.0",
        "hot_updates_pending_version": "1.5.0",
        "hot_updates_has_pending": true,
        "hot_updates_pending_ready": true,
        "hot_updates_ignore_list": ["2.0.0", "3.0.0"],
        "hot_updates_canary_version": null
    })"));

    JsonFileStateStore store(path, "1.0.0");
    UpdateState s;
    ASSERT_TRUE(store.Load(s).is_ok());
    EXPECT_EQ(s.meta.installed_version, "2.0.0");
    EXPECT_TRUE(std::holds_alternative<phase::Idle>(s.phase));
    EXPECT_FALSE(s.IsIgnored("2.0.0"));
    EXPECT_TRUE(s.IsIgnored("3.0.0"));
    // History was absent: seeded with bundle and installed.
    EXPECT_EQ(s.meta.version_history, (std::vector<std::string>{"1.0.0", "2.0.0"}));
}

} // namespace
} // namespace hotupdate
