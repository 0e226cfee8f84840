#pragma once

#include "hotupdate/collaborators.hpp"
#include "hotupdate/content_roots.hpp"
#include "hotupdate/content_switch_notifier.hpp"
#include "hotupdate/directory_transaction.hpp"
#include "hotupdate/state_store.hpp"
#include "hotupdate/update_state.hpp"
#include "util/result.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hotupdate {

enum class CheckOutcome {
    UpdateAvailable,
    UpToDate,
    Ignored,
    AlreadyStaged,
    DownloadBusy,
    AwaitingCanary,
};

std::string_view CheckOutcomeName(CheckOutcome outcome);

struct VersionInfo {
    std::string bundle_version;
    std::string installed_version;
    std::optional<std::string> previous_version;
    std::optional<std::string> canary_version;
    std::optional<std::string> pending_version;
    std::optional<std::string> downloading_version;
    bool has_pending_update = false;
    bool pending_update_ready = false;
    bool download_in_progress = false;
    std::string phase;
    std::string active_root;
    std::optional<std::string> staging_root;
    std::vector<std::string> ignore_list;
};

// Owns the update lifecycle: every state mutation and every content-root
// swap goes through here, serialised by one mutex. Content switch
// notifications are emitted after the mutex is released.
class UpdateManager {
public:
    struct Options {
        std::string entry_file = "index.html";
        std::shared_ptr<const IDirectoryOps> dir_ops;
    };

    UpdateManager(ContentRootResolver roots,
                  IStateStore& store,
                  const IBundleInfoProvider& bundle,
                  ContentSwitchNotifier& notifier);
    UpdateManager(ContentRootResolver roots,
                  IStateStore& store,
                  const IBundleInfoProvider& bundle,
                  ContentSwitchNotifier& notifier,
                  Options opt);

    UpdateManager(const UpdateManager&) = delete;
    UpdateManager& operator=(const UpdateManager&) = delete;

    // Process start: loads state, repairs interrupted swaps, seeds the
    // active root and applies a staged update. Runs once; later calls are
    // no-ops.
    Result LaunchRecovery();

    Result CheckAvailable(const std::string& remote_version, CheckOutcome& out);

    Result BeginDownload(const std::string& version);
    Result StagingComplete(const std::string& version, const std::string& extracted_path);
    // Transient failure before staging; no effect once staging completed.
    void AbortDownload(const std::string& version, const std::string& reason);
    Result CancelDownload();

    Result Install();

    Result ConfirmCanary(const std::string& version);
    Result ReportCanaryFailure();
    Result Rollback() { return ReportCanaryFailure(); }

    VersionInfo GetVersionInfo() const;
    std::vector<std::string> GetIgnoreList() const;
    std::vector<std::string> GetVersionHistory() const;
    LifecyclePhase Phase() const;
    UpdateState Snapshot() const;
    bool IsDownloadInProgress() const { return download_in_progress_.load(); }

    // Debug surface.
    Result AddToIgnoreList(const std::string& version);
    Result RemoveFromIgnoreList(const std::string& version);
    Result ClearIgnoreList();

    const ContentRootResolver& Roots() const { return roots_; }

private:
    void EnsureLoadedLocked();
    Result PersistLocked(UpdateState next);

    Result InstallLocked(std::optional<std::string>& switched_to);
    Result RollbackLocked(std::optional<std::string>& switched_to);
    Result RollbackToBundleLocked(const std::string& failed_version,
                                  std::optional<std::string>& switched_to);
    void EndDownloadLocked(const std::string& reason);

    // Launch recovery steps; each edits `next` and the disk.
    void RepairInterruptedSwap(UpdateState& next, bool& active_changed);
    void HealDiskInvariants(UpdateState& next);
    void SeedActiveRoot(UpdateState& next, bool& active_changed);

    Result MoveIntoStaging(const std::string& from, const std::string& to);
    void RemoveQuietly(const std::string& path) const;
    void SwitchedNotify(const std::optional<std::string>& root);

    ContentRootResolver roots_;
    IStateStore& store_;
    const IBundleInfoProvider& bundle_;
    ContentSwitchNotifier& notifier_;
    Options opt_;

    mutable std::mutex mu_;
    UpdateState state_;
    bool loaded_ = false;
    bool recovered_ = false;
    std::atomic_bool download_in_progress_{false};
};

} // namespace hotupdate
