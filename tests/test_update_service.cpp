#include <gtest/gtest.h>

#include "archive/archive_extractor.hpp"
#include "crypto/sha256.hpp"
#include "hotupdate/local_fetcher.hpp"
#include "hotupdate/update_service.hpp"
#include "io/tree_ops.hpp"
#include "testing.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace hotupdate {
namespace {

// Serves packages from memory, keyed by URL.
class FakeFetcher final : public IFetcher {
public:
    Result Fetch(const std::string& url,
                 const std::string& dest_path,
                 std::string_view,
                 IProgress*,
                 const std::atomic_bool* cancel) override {
        ++calls;
        if (hold) {
            std::unique_lock<std::mutex> lock(mu);
            entered = true;
            cv.notify_all();
            cv.wait(lock, [&] { return released || (cancel && cancel->load()); });
            if (cancel && cancel->load())
                return Result::Fail(ErrorCode::DownloadCancelled, "download cancelled");
        }
        if (!fail.is_ok())
            return fail;
        auto it = packages.find(url);
        if (it == packages.end())
            return Result::Fail(ErrorCode::HttpError, "HTTP 404");
        if (!testutil::WriteBytesFile(dest_path, it->second))
            return Result::Fail(ErrorCode::DownloadFailed, "write failed");
        return Result::Ok();
    }

    void WaitEntered() {
        std::unique_lock<std::mutex> lock(mu);
        cv.wait(lock, [&] { return entered; });
    }

    void Release() {
        std::lock_guard<std::mutex> lock(mu);
        released = true;
        cv.notify_all();
    }

    // Wakes a held fetch so it can observe the cancel flag.
    void Poke() {
        std::lock_guard<std::mutex> lock(mu);
        cv.notify_all();
    }

    std::map<std::string, std::vector<std::uint8_t>> packages;
    Result fail = Result::Ok();
    std::atomic<int> calls{0};
    bool hold = false;

private:
    std::mutex mu;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;
};

class UpdateServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        testutil::MakeContentDir(tmp.Path() + "/bundle/www", "bundle");
        manager = std::make_unique<UpdateManager>(ContentRootResolver(content_dir), store, bundle, notifier);
        ASSERT_TRUE(manager->LaunchRecovery().is_ok());
        service = std::make_unique<UpdateService>(*manager, fetcher, extractor);
    }

    void TearDown() override {
        service.reset();
        manager.reset();
    }

    testutil::TemporaryDirectory tmp;
    std::string content_dir = tmp.Path() + "/content";
    StaticBundleInfo bundle{"1.0.0", tmp.Path() + "/bundle/www"};
    JsonFileStateStore store{content_dir + "/hot_updates_state.json", "1.0.0"};
    ContentSwitchNotifier notifier;
    FakeFetcher fetcher;
    LibArchiveExtractor extractor;
    std::unique_ptr<UpdateManager> manager;
    std::unique_ptr<UpdateService> service;
};

TEST_F(UpdateServiceTest, StagesDownloadedPackage) {
    fetcher.packages["https://cdn/1.1.0.zip"] = testutil::BuildUpdatePackage("1.1.0");

    UpdateOutcome out;
    auto r = service->GetUpdate({"https://cdn/1.1.0.zip", "1.1.0", std::nullopt}, out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(out.staged);
    EXPECT_EQ(out.check, CheckOutcome::UpdateAvailable);
    EXPECT_EQ(manager->GetVersionInfo().pending_version, "1.1.0");
    EXPECT_EQ(testutil::ReadTextFile(content_dir + "/pending_update/1.1.0/index.html"),
              "<html>1.1.0</html>");
    // Work directory is gone.
    EXPECT_EQ(RemoveEntriesWithPrefix(content_dir, "temp_new_download-"), 0);
}

TEST_F(UpdateServiceTest, FindsWwwOneLevelDown) {
    fetcher.packages["u"] = testutil::BuildUpdatePackage("nested", "release/www/");
    UpdateOutcome out;
    ASSERT_TRUE(service->GetUpdate({"u", "1.1.0", std::nullopt}, out).is_ok());
    EXPECT_TRUE(out.staged);
}

TEST_F(UpdateServiceTest, ValidatesRequest) {
    UpdateOutcome out;
    EXPECT_EQ(service->GetUpdate({"", "1.1.0", std::nullopt}, out).code, ErrorCode::UrlRequired);
    EXPECT_EQ(service->GetUpdate({"u", "", std::nullopt}, out).code, ErrorCode::VersionRequired);
    EXPECT_EQ(fetcher.calls.load(), 0);
}

TEST_F(UpdateServiceTest, IgnoredVersionNeverFetched) {
    ASSERT_TRUE(manager->AddToIgnoreList("1.1.0").is_ok());
    fetcher.packages["u"] = testutil::BuildUpdatePackage("1.1.0");

    UpdateOutcome out;
    ASSERT_TRUE(service->GetUpdate({"u", "1.1.0", std::nullopt}, out).is_ok());
    EXPECT_EQ(out.check, CheckOutcome::Ignored);
    EXPECT_FALSE(out.staged);
    EXPECT_EQ(fetcher.calls.load(), 0);
    EXPECT_TRUE(std::holds_alternative<phase::Idle>(manager->Phase()));
}

TEST_F(UpdateServiceTest, UpToDateVersionNeverFetched) {
    UpdateOutcome out;
    ASSERT_TRUE(service->GetUpdate({"u", "1.0.0", std::nullopt}, out).is_ok());
    EXPECT_EQ(out.check, CheckOutcome::UpToDate);
    EXPECT_EQ(fetcher.calls.load(), 0);
}

TEST_F(UpdateServiceTest, FetchFailureReturnsToIdle) {
    UpdateOutcome out;
    auto r = service->GetUpdate({"missing", "1.1.0", std::nullopt}, out);
    EXPECT_EQ(r.code, ErrorCode::HttpError);
    EXPECT_FALSE(manager->IsDownloadInProgress());
    EXPECT_TRUE(std::holds_alternative<phase::Idle>(manager->Phase()));
    EXPECT_TRUE(manager->GetIgnoreList().empty());
}

TEST_F(UpdateServiceTest, PackageWithoutWwwFails) {
    fetcher.packages["u"] = testutil::BuildArchive({{"index.html", "<html></html>", AE_IFREG, ""}});
    UpdateOutcome out;
    EXPECT_EQ(service->GetUpdate({"u", "1.1.0", std::nullopt}, out).code, ErrorCode::WwwNotFound);
    EXPECT_FALSE(manager->IsDownloadInProgress());
}

TEST_F(UpdateServiceTest, CorruptPackageFailsExtraction) {
    const std::string junk = "definitely not a zip file";
    fetcher.packages["u"] = std::vector<std::uint8_t>(junk.begin(), junk.end());
    UpdateOutcome out;
    EXPECT_EQ(service->GetUpdate({"u", "1.1.0", std::nullopt}, out).code, ErrorCode::ExtractionFailed);
    EXPECT_TRUE(std::holds_alternative<phase::Idle>(manager->Phase()));
}

TEST_F(UpdateServiceTest, ChecksumMismatchFailsDownload) {
    const auto pkg = testutil::BuildUpdatePackage("1.1.0");
    fetcher.packages["u"] = pkg;

    UpdateOutcome out;
    auto r = service->GetUpdate({"u", "1.1.0", std::string(64, '0')}, out);
    EXPECT_EQ(r.code, ErrorCode::DownloadFailed);

    const std::string good = Sha256Hex(std::span<const std::uint8_t>(pkg.data(), pkg.size()));
    ASSERT_TRUE(service->GetUpdate({"u", "1.1.0", good}, out).is_ok());
    EXPECT_TRUE(out.staged);
}

TEST_F(UpdateServiceTest, AsyncRequestCompletesOnWorker) {
    fetcher.packages["u"] = testutil::BuildUpdatePackage("1.1.0");

    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    Result result = Result::Fail(ErrorCode::DownloadFailed, "not called");
    ASSERT_TRUE(service->GetUpdateAsync({"u", "1.1.0", std::nullopt},
                                        [&](const Result& r, const UpdateOutcome&) {
                                            std::lock_guard<std::mutex> lock(mu);
                                            result = r;
                                            done = true;
                                            cv.notify_all();
                                        })
                    .is_ok());

    std::unique_lock<std::mutex> lock(mu);
    cv.wait(lock, [&] { return done; });
    EXPECT_TRUE(result.is_ok()) << result.msg;
    lock.unlock();
    service->Wait();
    EXPECT_TRUE(std::holds_alternative<phase::Staged>(manager->Phase()));
}

TEST_F(UpdateServiceTest, RetryFromCallbackRunsOnNewWorker) {
    fetcher.packages["https://cdn/good.zip"] = testutil::BuildUpdatePackage("1.1.0");

    std::mutex mu;
    std::condition_variable cv;
    Result first;
    Result retry_started;
    Result second = Result::Fail(ErrorCode::DownloadFailed, "not called");
    bool retried = false;
    auto on_retry = [&](const Result& r, const UpdateOutcome&) {
        std::lock_guard<std::mutex> lock(mu);
        second = r;
        retried = true;
        cv.notify_all();
    };
    ASSERT_TRUE(service->GetUpdateAsync({"https://cdn/missing.zip", "1.1.0", std::nullopt},
                                        [&](const Result& r, const UpdateOutcome&) {
                                            first = r;
                                            if (!r.is_ok()) {
                                                retry_started = service->GetUpdateAsync(
                                                    {"https://cdn/good.zip", "1.1.0", std::nullopt},
                                                    on_retry);
                                            }
                                        })
                    .is_ok());

    {
        std::unique_lock<std::mutex> lock(mu);
        cv.wait(lock, [&] { return retried; });
    }
    service->Wait();

    EXPECT_EQ(first.code, ErrorCode::HttpError);
    EXPECT_TRUE(retry_started.is_ok()) << retry_started.msg;
    EXPECT_TRUE(second.is_ok()) << second.msg;
    EXPECT_EQ(fetcher.calls.load(), 2);
    EXPECT_TRUE(std::holds_alternative<phase::Staged>(manager->Phase()));
}

TEST_F(UpdateServiceTest, WaitFromCallbackReturns) {
    fetcher.packages["u"] = testutil::BuildUpdatePackage("1.1.0");

    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    ASSERT_TRUE(service->GetUpdateAsync({"u", "1.1.0", std::nullopt},
                                        [&](const Result&, const UpdateOutcome&) {
                                            service->Wait();
                                            std::lock_guard<std::mutex> lock(mu);
                                            done = true;
                                            cv.notify_all();
                                        })
                    .is_ok());

    {
        std::unique_lock<std::mutex> lock(mu);
        cv.wait(lock, [&] { return done; });
    }
    service->Wait();
    EXPECT_TRUE(std::holds_alternative<phase::Staged>(manager->Phase()));
}

TEST_F(UpdateServiceTest, SecondRequestWhileBusyIsRejected) {
    fetcher.packages["u"] = testutil::BuildUpdatePackage("1.1.0");
    fetcher.hold = true;

    ASSERT_TRUE(service->GetUpdateAsync({"u", "1.1.0", std::nullopt}, nullptr).is_ok());
    fetcher.WaitEntered();

    UpdateOutcome out;
    EXPECT_EQ(service->GetUpdate({"u", "1.2.0", std::nullopt}, out).code, ErrorCode::DownloadInProgress);
    EXPECT_EQ(manager->BeginDownload("1.2.0").code, ErrorCode::DownloadInProgress);

    fetcher.Release();
    service->Wait();
    EXPECT_TRUE(std::holds_alternative<phase::Staged>(manager->Phase()));
}

TEST_F(UpdateServiceTest, CancelStopsInFlightDownload) {
    fetcher.packages["u"] = testutil::BuildUpdatePackage("1.1.0");
    fetcher.hold = true;

    Result result;
    ASSERT_TRUE(service->GetUpdateAsync({"u", "1.1.0", std::nullopt},
                                        [&](const Result& r, const UpdateOutcome&) { result = r; })
                    .is_ok());
    fetcher.WaitEntered();

    service->Cancel();
    fetcher.Poke();
    service->Wait();

    EXPECT_EQ(result.code, ErrorCode::DownloadCancelled);
    EXPECT_FALSE(manager->IsDownloadInProgress());
    EXPECT_TRUE(std::holds_alternative<phase::Idle>(manager->Phase()));
    EXPECT_FALSE(PathExists(content_dir + "/pending_update/1.1.0"));
}

TEST_F(UpdateServiceTest, LocalFetcherEndToEnd) {
    const std::string pkg = tmp.Path() + "/1.1.0.zip";
    ASSERT_TRUE(testutil::WriteBytesFile(pkg, testutil::BuildUpdatePackage("1.1.0")));

    LocalFetcher local;
    UpdateService svc(*manager, local, extractor);
    UpdateOutcome out;
    auto r = svc.GetUpdate({"file://" + pkg, "1.1.0", std::nullopt}, out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    ASSERT_TRUE(manager->Install().is_ok());
    EXPECT_EQ(testutil::ReadTextFile(content_dir + "/www/index.html"), "<html>1.1.0</html>");
}

} // namespace
} // namespace hotupdate
