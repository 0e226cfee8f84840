#pragma once

#include "hotupdate/collaborators.hpp"
#include "hotupdate/progress.hpp"
#include "hotupdate/update_manager.hpp"
#include "util/result.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace hotupdate {

struct UpdateRequest {
    std::string url;
    std::string version;
    // Expected hex digest of the package; unchecked when absent.
    std::optional<std::string> sha256;
};

struct UpdateOutcome {
    CheckOutcome check = CheckOutcome::UpToDate;
    // True when this request staged new content.
    bool staged = false;
};

// Runs fetch, verification and extraction for one update request and
// hands the result to the manager. At most one request runs at a time.
class UpdateService {
public:
    using Callback = std::function<void(const Result&, const UpdateOutcome&)>;

    UpdateService(UpdateManager& manager,
                  IFetcher& fetcher,
                  IExtractor& extractor,
                  IProgress* progress = nullptr);
    UpdateService(const UpdateService&) = delete;
    UpdateService& operator=(const UpdateService&) = delete;
    ~UpdateService();

    Result GetUpdate(const UpdateRequest& req, UpdateOutcome& out);

    // Validates synchronously, then runs on the worker thread. `done` is
    // invoked on the worker thread.
    Result GetUpdateAsync(UpdateRequest req, Callback done);

    void Cancel();
    // Blocks until the running asynchronous request, if any, finished,
    // including requests started from its callback. Called from a callback
    // it does not wait for the calling worker.
    void Wait();

private:
    static Result Validate(const UpdateRequest& req);
    Result Run(const UpdateRequest& req, UpdateOutcome& out);
    Result FetchAndStage(const UpdateRequest& req);
    bool Cancelled() const { return cancel_.load(std::memory_order_relaxed); }

    UpdateManager& manager_;
    IFetcher& fetcher_;
    IExtractor& extractor_;
    IProgress* progress_ = nullptr;

    std::atomic_bool cancel_{false};
    std::atomic_bool busy_{false};
    std::mutex worker_mu_;
    std::thread worker_;
    // A worker that started its successor from its own callback.
    std::thread retired_;
};

} // namespace hotupdate
