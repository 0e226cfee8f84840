#include "hotupdate/update_service.hpp"

#include "crypto/sha256.hpp"
#include "hotupdate/content_tree.hpp"
#include "hotupdate/directory_transaction.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace hotupdate {

namespace {

constexpr const char kPackageName[] = "update.pkg";
constexpr const char kExtractDirName[] = "extracted";
constexpr const char kContentFolder[] = "www";

Result CancelledResult() {
    return Result::Fail(ErrorCode::DownloadCancelled, "Download cancelled");
}

} // namespace

UpdateService::UpdateService(UpdateManager& manager,
                             IFetcher& fetcher,
                             IExtractor& extractor,
                             IProgress* progress)
    : manager_(manager), fetcher_(fetcher), extractor_(extractor), progress_(progress) {}

UpdateService::~UpdateService() {
    Wait();
}

Result UpdateService::Validate(const UpdateRequest& req) {
    if (req.url.empty())
        return Result::Fail(ErrorCode::UrlRequired, "URL is required");
    if (req.version.empty())
        return Result::Fail(ErrorCode::VersionRequired, "Version is required");
    return Result::Ok();
}

Result UpdateService::GetUpdate(const UpdateRequest& req, UpdateOutcome& out) {
    auto vr = Validate(req);
    if (!vr.is_ok())
        return vr;
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true))
        return Result::Fail(ErrorCode::DownloadInProgress, "Download already in progress");

    cancel_.store(false);
    auto r = Run(req, out);
    busy_.store(false);
    return r;
}

Result UpdateService::GetUpdateAsync(UpdateRequest req, Callback done) {
    auto vr = Validate(req);
    if (!vr.is_ok())
        return vr;

    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(worker_mu_);
        bool expected = false;
        if (!busy_.compare_exchange_strong(expected, true))
            return Result::Fail(ErrorCode::DownloadInProgress, "Download already in progress");

        // The previous worker already cleared busy_, so it is about to exit.
        // When this call comes from its callback it cannot join itself; it is
        // parked in retired_ and joined by a later request or by Wait().
        if (worker_.joinable()) {
            if (worker_.get_id() == std::this_thread::get_id()) {
                finished = std::move(retired_);
                retired_ = std::move(worker_);
            } else {
                finished = std::move(worker_);
            }
        }

        cancel_.store(false);
        worker_ = std::thread([this, req = std::move(req), done = std::move(done)]() {
            UpdateOutcome out;
            const Result r = Run(req, out);
            busy_.store(false);
            if (done)
                done(r, out);
        });
    }
    if (finished.joinable())
        finished.join();
    return Result::Ok();
}

void UpdateService::Cancel() {
    cancel_.store(true);
    auto r = manager_.CancelDownload();
    if (!r.is_ok())
        LogWarn("Cancel: %s", r.message().c_str());
}

void UpdateService::Wait() {
    const auto self = std::this_thread::get_id();
    for (;;) {
        std::thread t;
        {
            std::lock_guard<std::mutex> lock(worker_mu_);
            if (retired_.joinable() && retired_.get_id() != self) {
                t = std::move(retired_);
            } else if (worker_.joinable() && worker_.get_id() != self) {
                t = std::move(worker_);
            }
        }
        // Nothing left, or only the calling worker itself.
        if (!t.joinable())
            return;
        t.join();
    }
}

Result UpdateService::Run(const UpdateRequest& req, UpdateOutcome& out) {
    out = UpdateOutcome{};
    auto r = manager_.CheckAvailable(req.version, out.check);
    if (!r.is_ok())
        return r;

    switch (out.check) {
    case CheckOutcome::UpToDate:
        LogInfo("Version %s is up to date", req.version.c_str());
        return Result::Ok();
    case CheckOutcome::Ignored:
        LogInfo("Version %s is ignored, not downloading", req.version.c_str());
        return Result::Ok();
    case CheckOutcome::AlreadyStaged:
        LogInfo("Version %s is already staged", req.version.c_str());
        return Result::Ok();
    case CheckOutcome::DownloadBusy:
        return Result::Fail(ErrorCode::DownloadInProgress, "Download already in progress");
    case CheckOutcome::AwaitingCanary:
        return Result::Fail(ErrorCode::CanaryPending, "Installed update is awaiting canary confirmation");
    case CheckOutcome::UpdateAvailable:
        break;
    }

    r = manager_.BeginDownload(req.version);
    if (!r.is_ok())
        return r;

    r = FetchAndStage(req);
    if (!r.is_ok()) {
        // No-op when the manager already left the download state.
        manager_.AbortDownload(req.version, r.message());
        return r;
    }
    out.staged = true;
    return Result::Ok();
}

Result UpdateService::FetchAndStage(const UpdateRequest& req) {
    if (Cancelled())
        return CancelledResult();

    ScopedTempDir work;
    auto r = ScopedTempDir::Create(manager_.Roots().DownloadTempPrefix(), work);
    if (!r.is_ok())
        return Result::Fail(ErrorCode::TempDirError, r.message());

    const std::string package = (fs::path(work.Path()) / kPackageName).string();
    const std::string extract_dir = (fs::path(work.Path()) / kExtractDirName).string();

    LogInfo("Downloading %s from %s", req.version.c_str(), req.url.c_str());
    r = fetcher_.Fetch(req.url, package, req.version, progress_, &cancel_);
    if (!r.is_ok())
        return r;
    if (Cancelled())
        return CancelledResult();

    if (req.sha256 && !req.sha256->empty()) {
        std::string actual;
        r = Sha256HexFile(package, actual);
        if (!r.is_ok())
            return r;
        if (!DigestEquals(actual, *req.sha256)) {
            return Result::Fail(ErrorCode::DownloadFailed,
                                "Package checksum mismatch: expected " + *req.sha256 + ", got " + actual);
        }
        LogDebug("Package checksum verified");
    }

    r = extractor_.Extract(package, extract_dir);
    if (!r.is_ok())
        return r;
    if (Cancelled())
        return CancelledResult();

    const std::string content = FindContentFolder(extract_dir, kContentFolder);
    if (content.empty())
        return Result::Fail(ErrorCode::WwwNotFound, "www folder not found in package");

    return manager_.StagingComplete(req.version, content);
}

} // namespace hotupdate
