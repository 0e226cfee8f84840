#include <gtest/gtest.h>

#include "hotupdate/local_fetcher.hpp"
#include "testing.hpp"

#include <atomic>

namespace hotupdate {
namespace {

class CountingProgress final : public IProgress {
public:
    void OnProgress(const ProgressEvent& e) override {
        ++events;
        last_done = e.done_bytes;
        last_total = e.total_bytes;
    }

    int events = 0;
    std::uint64_t last_done = 0;
    std::uint64_t last_total = 0;
};

TEST(LocalFetcherTest, ResolvesFileUrls) {
    EXPECT_EQ(LocalFetcher::LocalPathFromUrl("file:///srv/update.zip"), "/srv/update.zip");
    EXPECT_EQ(LocalFetcher::LocalPathFromUrl("file://localhost/srv/u.zip"), "/srv/u.zip");
    EXPECT_EQ(LocalFetcher::LocalPathFromUrl("/srv/update.zip"), "/srv/update.zip");
    EXPECT_EQ(LocalFetcher::LocalPathFromUrl("https://example.com/u.zip"), "");
}

TEST(LocalFetcherTest, CopiesFileAndReportsProgress) {
    testutil::TemporaryDirectory tmp;
    const std::string src = tmp.Path() + "/src.bin";
    const std::string payload(10000, 'p');
    ASSERT_TRUE(testutil::WriteTextFile(src, payload));

    LocalFetcher fetcher(4096);
    CountingProgress progress;
    auto r = fetcher.Fetch("file://" + src, tmp.Path() + "/dst.bin", "1.0.0", &progress, nullptr);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(testutil::ReadTextFile(tmp.Path() + "/dst.bin"), payload);
    EXPECT_EQ(progress.events, 3);
    EXPECT_EQ(progress.last_done, payload.size());
    EXPECT_EQ(progress.last_total, payload.size());
}

TEST(LocalFetcherTest, ErrorCodes) {
    testutil::TemporaryDirectory tmp;
    LocalFetcher fetcher;

    EXPECT_EQ(fetcher.Fetch("", tmp.Path() + "/d", "1", nullptr, nullptr).code, ErrorCode::UrlRequired);
    EXPECT_EQ(fetcher.Fetch("https://example.com/u.zip", tmp.Path() + "/d", "1", nullptr, nullptr).code,
              ErrorCode::DownloadFailed);
    EXPECT_EQ(fetcher.Fetch(tmp.Path() + "/missing.zip", tmp.Path() + "/d", "1", nullptr, nullptr).code,
              ErrorCode::DownloadFailed);
    EXPECT_EQ(fetcher.Fetch(tmp.Path(), tmp.Path() + "/d", "1", nullptr, nullptr).code,
              ErrorCode::DownloadFailed);
}

TEST(LocalFetcherTest, HonoursCancelFlag) {
    testutil::TemporaryDirectory tmp;
    const std::string src = tmp.Path() + "/src.bin";
    ASSERT_TRUE(testutil::WriteTextFile(src, "data"));

    std::atomic_bool cancel{true};
    LocalFetcher fetcher;
    auto r = fetcher.Fetch(src, tmp.Path() + "/dst.bin", "1", nullptr, &cancel);
    EXPECT_EQ(r.code, ErrorCode::DownloadCancelled);
}

} // namespace
} // namespace hotupdate
