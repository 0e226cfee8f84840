#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/host_config.hpp"

#include <string>

namespace hotupdate {
namespace {

class HostConfigTest : public ::testing::Test {
protected:
    Result Load(const std::string& text, HostConfig& out) {
        const std::string path = tmp.Path() + "/hot-updater.json";
        EXPECT_TRUE(testutil::WriteTextFile(path, text));
        return HostConfig::LoadFromFile(path, out);
    }

    testutil::TemporaryDirectory tmp;
};

TEST_F(HostConfigTest, AppliesDefaults) {
    HostConfig cfg;
    auto r = Load(R"({"content_dir":"/data/app/","bundle_version":"1.0.0"})", cfg);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cfg.content_dir, "/data/app/");
    EXPECT_EQ(cfg.entry_file, "index.html");
    EXPECT_EQ(cfg.state_file, "/data/app/hot_updates_state.json");
    EXPECT_EQ(cfg.log_level, LogLevel::Info);
    EXPECT_FALSE(cfg.debug_api);
    EXPECT_TRUE(cfg.bundle_www_dir.empty());
    EXPECT_EQ(cfg.max_extracted_bytes, 0u);
}

TEST_F(HostConfigTest, RejectsNegativeExtractionLimit) {
    HostConfig cfg;
    EXPECT_EQ(Load(R"({"content_dir":"/d","bundle_version":"1.0.0","max_extracted_bytes":-1})", cfg).code,
              ErrorCode::ConfigError);
}

TEST_F(HostConfigTest, ReadsAllFields) {
    HostConfig cfg;
    auto r = Load(R"({
        "content_dir": "/data/app",
        "bundle_version": "2.1.0",
        "bundle_www_dir": "/opt/app/www",
        "entry_file": "main.html",
        "state_file": "/data/state.json",
        "log_level": "WARNING",
        "debug_api": true,
        "max_extracted_bytes": 1048576
    })",
                  cfg);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cfg.bundle_version, "2.1.0");
    EXPECT_EQ(cfg.bundle_www_dir, "/opt/app/www");
    EXPECT_EQ(cfg.entry_file, "main.html");
    EXPECT_EQ(cfg.state_file, "/data/state.json");
    EXPECT_EQ(cfg.log_level, LogLevel::Warn);
    EXPECT_TRUE(cfg.debug_api);
    EXPECT_EQ(cfg.max_extracted_bytes, 1048576u);
}

TEST_F(HostConfigTest, RejectsMissingRequiredFields) {
    HostConfig cfg;
    EXPECT_EQ(Load(R"({"bundle_version":"1.0.0"})", cfg).code, ErrorCode::ConfigError);
    EXPECT_EQ(Load(R"({"content_dir":"/data/app"})", cfg).code, ErrorCode::ConfigError);
}

TEST_F(HostConfigTest, RejectsBadValues) {
    HostConfig cfg;
    EXPECT_EQ(Load(R"({"content_dir":"/d","bundle_version":"1","log_level":"loud"})", cfg).code,
              ErrorCode::ConfigError);
    EXPECT_EQ(Load(R"({"content_dir":"/d","bundle_version":"1","entry_file":"a/index.html"})", cfg).code,
              ErrorCode::ConfigError);
    EXPECT_EQ(Load("{not json", cfg).code, ErrorCode::ConfigError);
}

TEST_F(HostConfigTest, MissingFileFails) {
    HostConfig cfg;
    EXPECT_EQ(HostConfig::LoadFromFile(tmp.Path() + "/absent.json", cfg).code, ErrorCode::ConfigError);
}

} // namespace
} // namespace hotupdate
