#include "hotupdate/update_manager.hpp"

#include "hotupdate/content_tree.hpp"
#include "io/tree_ops.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/version_comparator.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace hotupdate {

namespace {

std::optional<std::string> PriorStaged(const UpdateState& s) {
    if (const auto* dl = std::get_if<phase::Downloading>(&s.phase))
        return dl->prior_staged;
    return std::nullopt;
}

LifecyclePhase PhaseAfterDownload(const UpdateState& s) {
    if (auto prior = PriorStaged(s))
        return phase::Staged{*prior};
    return phase::Idle{};
}

bool SameRecord(const UpdateState& a, const UpdateState& b) {
    return EncodeState(a) == EncodeState(b);
}

} // namespace

std::string_view CheckOutcomeName(CheckOutcome outcome) {
    switch (outcome) {
    case CheckOutcome::UpdateAvailable:
        return "update_available";
    case CheckOutcome::UpToDate:
        return "up_to_date";
    case CheckOutcome::Ignored:
        return "ignored";
    case CheckOutcome::AlreadyStaged:
        return "already_staged";
    case CheckOutcome::DownloadBusy:
        return "download_in_progress";
    case CheckOutcome::AwaitingCanary:
        return "awaiting_canary";
    }
    return "unknown";
}

UpdateManager::UpdateManager(ContentRootResolver roots,
                             IStateStore& store,
                             const IBundleInfoProvider& bundle,
                             ContentSwitchNotifier& notifier)
    : UpdateManager(std::move(roots), store, bundle, notifier, Options{}) {}

UpdateManager::UpdateManager(ContentRootResolver roots,
                             IStateStore& store,
                             const IBundleInfoProvider& bundle,
                             ContentSwitchNotifier& notifier,
                             Options opt)
    : roots_(std::move(roots)), store_(store), bundle_(bundle), notifier_(notifier),
      opt_(std::move(opt)) {
    if (!opt_.dir_ops)
        opt_.dir_ops = DefaultDirectoryOps();
    if (opt_.entry_file.empty())
        opt_.entry_file = "index.html";
    EnsureLoadedLocked();
}

void UpdateManager::EnsureLoadedLocked() {
    if (loaded_)
        return;
    UpdateState loaded;
    auto r = store_.Load(loaded);
    if (!r.is_ok())
        LogWarn("Continuing with default update state: %s", r.message().c_str());
    state_ = std::move(loaded);
    download_in_progress_.store(state_.DownloadInProgress());
    loaded_ = true;
}

Result UpdateManager::PersistLocked(UpdateState next) {
    auto r = store_.Save(next);
    if (!r.is_ok())
        return Result::Fail(ErrorCode::StateIoError, r.message());
    state_ = std::move(next);
    download_in_progress_.store(state_.DownloadInProgress());
    return Result::Ok();
}

void UpdateManager::RemoveQuietly(const std::string& path) const {
    if (!path.empty() && PathExists(path))
        opt_.dir_ops->RemoveTree(path);
}

void UpdateManager::SwitchedNotify(const std::optional<std::string>& root) {
    if (root)
        notifier_.Notify(*root);
}

// ---------------------------------------------------------------------------
// check / download / staging

Result UpdateManager::CheckAvailable(const std::string& remote_version, CheckOutcome& out) {
    if (remote_version.empty())
        return Result::Fail(ErrorCode::VersionRequired, "Version is required");

    std::lock_guard<std::mutex> lock(mu_);
    EnsureLoadedLocked();

    if (!VersionComparator::IsNewer(remote_version, state_.meta.installed_version)) {
        out = CheckOutcome::UpToDate;
    } else if (state_.IsIgnored(remote_version)) {
        out = CheckOutcome::Ignored;
    } else if (std::holds_alternative<phase::CanaryPending>(state_.phase)) {
        out = CheckOutcome::AwaitingCanary;
    } else if (state_.DownloadInProgress()) {
        out = CheckOutcome::DownloadBusy;
    } else if (auto staged = state_.PendingVersion();
               staged && VersionComparator::Equivalent(*staged, remote_version)) {
        out = CheckOutcome::AlreadyStaged;
    } else {
        out = CheckOutcome::UpdateAvailable;
    }

    LogDebug("Check %s against installed %s: %s", remote_version.c_str(),
             state_.meta.installed_version.c_str(), std::string(CheckOutcomeName(out)).c_str());
    return Result::Ok();
}

Result UpdateManager::BeginDownload(const std::string& version) {
    if (version.empty())
        return Result::Fail(ErrorCode::VersionRequired, "Version is required");
    if (download_in_progress_.load())
        return Result::Fail(ErrorCode::DownloadInProgress, "Download already in progress");

    std::lock_guard<std::mutex> lock(mu_);
    EnsureLoadedLocked();

    if (state_.DownloadInProgress())
        return Result::Fail(ErrorCode::DownloadInProgress, "Download already in progress");
    if (const auto canary = state_.CanaryVersion()) {
        return Result::Fail(ErrorCode::CanaryPending,
                            "Version " + *canary + " is awaiting canary confirmation");
    }
    if (!VersionComparator::IsNewer(version, state_.meta.installed_version)) {
        return Result::Fail(ErrorCode::VersionNotEligible,
                            "Version " + version + " is not newer than installed " +
                                state_.meta.installed_version);
    }
    if (state_.IsIgnored(version)) {
        return Result::Fail(ErrorCode::VersionNotEligible,
                            "Version " + version + " is in the ignore list");
    }
    if (const auto pending = state_.PendingVersion();
        pending && VersionComparator::Equivalent(*pending, version)) {
        return Result::Fail(ErrorCode::VersionNotEligible,
                            "Version " + version + " is already staged");
    }

    UpdateState next = state_;
    next.phase = phase::Downloading{version, state_.PendingVersion()};
    auto r = PersistLocked(std::move(next));
    if (!r.is_ok())
        return r;

    LogInfo("Download of %s started", version.c_str());
    return Result::Ok();
}

void UpdateManager::EndDownloadLocked(const std::string& reason) {
    const auto version = state_.DownloadingVersion();
    if (!version)
        return;

    UpdateState next = state_;
    next.phase = PhaseAfterDownload(state_);
    auto r = PersistLocked(next);
    if (!r.is_ok()) {
        // Keep serving requests; the stale record is healed at next launch.
        LogError("Cannot persist end of download: %s", r.message().c_str());
        state_ = std::move(next);
        download_in_progress_.store(false);
    }
    LogWarn("Download of %s ended: %s", version->c_str(), reason.c_str());
}

Result UpdateManager::MoveIntoStaging(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::create_directories(roots_.StagingBase(), ec);
    if (ec) {
        return Result::Fail(ErrorCode::TempDirError,
                            "create " + roots_.StagingBase() + ": " + ec.message());
    }
    RemoveQuietly(to);

    auto r = opt_.dir_ops->Rename(from, to);
    if (r.is_ok())
        return r;

    // Extraction may have happened on another filesystem; copy next to the
    // target and rename from there.
    LogDebug("rename failed (%s), copying instead", r.message().c_str());
    ScopedTempDir tmp;
    auto tr = ScopedTempDir::Create(roots_.StagingBase() + "/.incoming-", tmp, opt_.dir_ops);
    if (!tr.is_ok())
        return tr;

    std::string err;
    if (!CopyTree(from, tmp.Path(), err))
        return Result::Fail(ErrorCode::TempDirError, err);

    r = opt_.dir_ops->Rename(tmp.Path(), to);
    if (!r.is_ok())
        return Result::Fail(ErrorCode::TempDirError, r.message());
    tmp.Release();
    RemoveQuietly(from);
    return Result::Ok();
}

Result UpdateManager::StagingComplete(const std::string& version, const std::string& extracted_path) {
    std::lock_guard<std::mutex> lock(mu_);
    EnsureLoadedLocked();

    const auto downloading = state_.DownloadingVersion();
    if (!downloading || *downloading != version) {
        RemoveQuietly(extracted_path);
        return Result::Fail(ErrorCode::DownloadCancelled,
                            "Download of " + version + " is no longer active");
    }

    auto vr = VerifyContentRoot(extracted_path, opt_.entry_file);
    if (vr.is_ok())
        vr = WriteVersionMarker(extracted_path, version);
    if (!vr.is_ok()) {
        RemoveQuietly(extracted_path);
        EndDownloadLocked(vr.message());
        return Result::Fail(ErrorCode::ExtractionFailed, vr.message());
    }

    const std::string staging = roots_.StagingRoot(version);
    auto mr = MoveIntoStaging(extracted_path, staging);
    if (!mr.is_ok()) {
        RemoveQuietly(extracted_path);
        EndDownloadLocked(mr.message());
        return mr;
    }

    UpdateState next = state_;
    next.phase = phase::Staged{version};
    auto r = PersistLocked(std::move(next));
    if (!r.is_ok()) {
        RemoveQuietly(staging);
        EndDownloadLocked(r.message());
        return r;
    }

    // Only one staged version is kept.
    const std::string keep = VersionDirName(version);
    std::error_code ec;
    for (fs::directory_iterator it(roots_.StagingBase(), ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string() != keep)
            RemoveQuietly(it->path().string());
    }

    LogInfo("Update %s staged at %s", version.c_str(), staging.c_str());
    return Result::Ok();
}

void UpdateManager::AbortDownload(const std::string& version, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mu_);
    EnsureLoadedLocked();
    const auto downloading = state_.DownloadingVersion();
    if (!downloading || *downloading != version)
        return;
    EndDownloadLocked(reason);
}

Result UpdateManager::CancelDownload() {
    std::lock_guard<std::mutex> lock(mu_);
    EnsureLoadedLocked();
    if (!state_.DownloadInProgress()) {
        LogDebug("Cancel requested with no download in progress");
        return Result::Ok();
    }
    EndDownloadLocked("cancelled");
    return Result::Ok();
}

// ---------------------------------------------------------------------------
// install / canary / rollback

Result UpdateManager::Install() {
    std::optional<std::string> switched_to;
    Result r;
    {
        std::lock_guard<std::mutex> lock(mu_);
        EnsureLoadedLocked();
        r = InstallLocked(switched_to);
    }
    SwitchedNotify(switched_to);
    return r;
}

Result UpdateManager::InstallLocked(std::optional<std::string>& switched_to) {
    const auto pending = state_.PendingVersion();
    if (!pending)
        return Result::Fail(ErrorCode::NoUpdateReady, "No update ready to install");

    // A staged version stays installable while a newer download runs; the
    // install ends that download.
    const auto superseded_download = state_.DownloadingVersion();
    const std::string version = *pending;
    const std::string staging = roots_.StagingRoot(version);
    const std::string active = roots_.ActiveRoot();
    const std::string backup = roots_.BackupRoot();

    auto vr = VerifyContentRoot(staging, opt_.entry_file);
    if (!vr.is_ok()) {
        LogError("Staged update %s unusable: %s", version.c_str(), vr.message().c_str());
        RemoveQuietly(staging);
        UpdateState next = state_;
        if (superseded_download) {
            next.phase = phase::Downloading{*superseded_download, std::nullopt};
        } else {
            next.phase = phase::Idle{};
        }
        auto pr = PersistLocked(std::move(next));
        if (!pr.is_ok())
            LogError("Cannot persist healed state: %s", pr.message().c_str());
        return Result::Fail(ErrorCode::UpdateFilesNotFound,
                            "Update files not found for " + version + ": " + vr.message());
    }

    const bool had_active = PathExists(active);

    DirectoryTransaction tx(roots_.TombPrefix(), opt_.dir_ops);
    auto r = tx.Discard(backup);
    if (r.is_ok() && had_active)
        r = tx.Move(active, backup);
    if (r.is_ok())
        r = tx.Move(staging, active);
    if (!r.is_ok()) {
        LogError("Install of %s failed: %s", version.c_str(), r.message().c_str());
        return Result::Fail(ErrorCode::InstallFailed, "Install failed: " + r.message());
    }

    UpdateState next = state_;
    if (had_active) {
        next.meta.previous_version = state_.meta.installed_version;
    } else {
        next.meta.previous_version.reset();
    }
    next.meta.installed_version = version;
    next.RemoveIgnored(version);
    next.AddToHistory(version);
    next.phase = phase::CanaryPending{version};

    r = PersistLocked(std::move(next));
    if (!r.is_ok()) {
        LogError("Install of %s not recorded, restoring roots: %s", version.c_str(),
                 r.message().c_str());
        return Result::Fail(ErrorCode::InstallFailed, "Install failed: " + r.message());
    }

    r = tx.Commit();
    if (!r.is_ok())
        LogWarn("Install of %s committed with warnings: %s", version.c_str(), r.message().c_str());

    if (superseded_download)
        LogWarn("Download of %s ended by install of %s", superseded_download->c_str(), version.c_str());
    LogInfo("Installed %s (previous %s), awaiting canary", version.c_str(),
            state_.meta.previous_version ? state_.meta.previous_version->c_str() : "none");
    switched_to = active;
    return Result::Ok();
}

Result UpdateManager::ConfirmCanary(const std::string& version) {
    if (version.empty())
        return Result::Fail(ErrorCode::VersionRequired, "Version is required");

    std::lock_guard<std::mutex> lock(mu_);
    EnsureLoadedLocked();

    const auto canary = state_.CanaryVersion();
    if (!canary || !VersionComparator::Equivalent(*canary, version)) {
        LogDebug("Canary %s: nothing awaiting confirmation", version.c_str());
        return Result::Ok();
    }

    UpdateState next = state_;
    next.meta.previous_version.reset();
    next.phase = phase::Idle{};
    auto r = PersistLocked(std::move(next));
    if (!r.is_ok())
        return r;

    RemoveQuietly(roots_.BackupRoot());
    LogInfo("Canary confirmed for %s", version.c_str());
    return Result::Ok();
}

Result UpdateManager::ReportCanaryFailure() {
    std::optional<std::string> switched_to;
    Result r;
    {
        std::lock_guard<std::mutex> lock(mu_);
        EnsureLoadedLocked();
        r = RollbackLocked(switched_to);
    }
    SwitchedNotify(switched_to);
    return r;
}

Result UpdateManager::RollbackLocked(std::optional<std::string>& switched_to) {
    const auto canary = state_.CanaryVersion();
    if (!canary)
        return Result::Fail(ErrorCode::RollbackFailed, "No update awaiting canary confirmation");

    const std::string failed = *canary;
    const std::string active = roots_.ActiveRoot();
    const std::string backup = roots_.BackupRoot();

    std::optional<std::string> restore_version = state_.meta.previous_version;
    if (!restore_version && IsDirectory(backup))
        restore_version = ReadVersionMarker(backup);

    if (!IsDirectory(backup) || !restore_version) {
        LogWarn("No backup root for %s, falling back to bundled content", failed.c_str());
        return RollbackToBundleLocked(failed, switched_to);
    }

    DirectoryTransaction tx(roots_.TombPrefix(), opt_.dir_ops);
    auto r = tx.Discard(active);
    if (r.is_ok())
        r = tx.Move(backup, active);
    if (!r.is_ok()) {
        LogError("Rollback of %s failed: %s", failed.c_str(), r.message().c_str());
        return Result::Fail(ErrorCode::RollbackFailed, "Rollback failed: " + r.message());
    }

    UpdateState next = state_;
    next.meta.installed_version = *restore_version;
    next.meta.previous_version.reset();
    next.RemoveIgnored(*restore_version);
    next.AddIgnored(failed);
    next.RemoveFromHistory(failed);
    next.phase = phase::Idle{};

    r = PersistLocked(std::move(next));
    if (!r.is_ok())
        return Result::Fail(ErrorCode::RollbackFailed, "Rollback failed: " + r.message());

    r = tx.Commit();
    if (!r.is_ok())
        LogWarn("Rollback committed with warnings: %s", r.message().c_str());

    LogWarn("Rolled back %s to %s; %s is now ignored", failed.c_str(),
            state_.meta.installed_version.c_str(), failed.c_str());
    switched_to = active;
    return Result::Ok();
}

Result UpdateManager::RollbackToBundleLocked(const std::string& failed_version,
                                             std::optional<std::string>& switched_to) {
    const std::string bundle_dir = bundle_.BundleContentDir();
    const std::string bundle_version = bundle_.BundleVersion();

    if (bundle_dir.empty() || !IsDirectory(bundle_dir)) {
        return Result::Fail(ErrorCode::RollbackFailed,
                            "No backup root and no bundled content to restore");
    }
    if (VersionComparator::Equivalent(bundle_version, failed_version)) {
        return Result::Fail(ErrorCode::RollbackFailed,
                            "Bundled content is the failing version " + failed_version);
    }

    ScopedTempDir copy;
    auto r = ScopedTempDir::Create(roots_.TombPrefix(), copy, opt_.dir_ops);
    if (!r.is_ok())
        return Result::Fail(ErrorCode::RollbackFailed, r.message());

    std::string err;
    if (!CopyTree(bundle_dir, copy.Path(), err))
        return Result::Fail(ErrorCode::RollbackFailed, "copy bundled content: " + err);
    r = WriteVersionMarker(copy.Path(), bundle_version);
    if (!r.is_ok())
        return Result::Fail(ErrorCode::RollbackFailed, r.message());

    const std::string active = roots_.ActiveRoot();
    DirectoryTransaction tx(roots_.TombPrefix(), opt_.dir_ops);
    r = tx.Discard(active);
    if (r.is_ok())
        r = tx.Move(copy.Path(), active);
    if (!r.is_ok())
        return Result::Fail(ErrorCode::RollbackFailed, "Rollback failed: " + r.message());
    const std::string copy_path = copy.Release();

    UpdateState next = state_;
    next.meta.installed_version = bundle_version;
    next.meta.previous_version.reset();
    next.RemoveIgnored(bundle_version);
    next.AddIgnored(failed_version);
    next.RemoveFromHistory(failed_version);
    next.AddToHistory(bundle_version);
    next.phase = phase::Idle{};

    r = PersistLocked(std::move(next));
    if (!r.is_ok()) {
        // Undoing the transaction moves the copy back out; it must not leak.
        tx.Rollback();
        RemoveQuietly(copy_path);
        return Result::Fail(ErrorCode::RollbackFailed, "Rollback failed: " + r.message());
    }
    r = tx.Commit();
    if (!r.is_ok())
        LogWarn("Rollback committed with warnings: %s", r.message().c_str());

    LogWarn("Rolled back %s to bundled %s", failed_version.c_str(), bundle_version.c_str());
    switched_to = active;
    return Result::Ok();
}

// ---------------------------------------------------------------------------
// launch recovery

void UpdateManager::RepairInterruptedSwap(UpdateState& next, bool& active_changed) {
    const std::string active = roots_.ActiveRoot();
    const std::string backup = roots_.BackupRoot();

    // Crash after the active root was moved aside: put the backup back.
    if (!PathExists(active) && IsDirectory(backup)) {
        auto r = opt_.dir_ops->Rename(backup, active);
        if (r.is_ok()) {
            LogWarn("Restored %s from interrupted swap", active.c_str());
            active_changed = true;
        } else {
            LogError("Cannot restore %s: %s", active.c_str(), r.message().c_str());
        }
    }

    if (!IsDirectory(active))
        return;
    const auto marker = ReadVersionMarker(active);
    if (!marker || VersionComparator::Equivalent(*marker, next.meta.installed_version))
        return;

    const auto* staged = std::get_if<phase::Staged>(&next.phase);
    if (staged && VersionComparator::Equivalent(*marker, staged->version) &&
        !PathExists(roots_.StagingRoot(staged->version))) {
        // The swap finished but the state commit did not.
        LogWarn("Completing interrupted install of %s", marker->c_str());
        if (IsDirectory(backup)) {
            next.meta.previous_version = next.meta.installed_version;
        } else {
            next.meta.previous_version.reset();
        }
        next.meta.installed_version = staged->version;
        next.AddToHistory(staged->version);
        next.phase = phase::CanaryPending{staged->version};
        return;
    }

    if (next.meta.previous_version &&
        VersionComparator::Equivalent(*marker, *next.meta.previous_version)) {
        // The previous root is active again: a rollback got that far.
        const std::string failed = next.meta.installed_version;
        LogWarn("Completing interrupted rollback of %s", failed.c_str());
        next.meta.installed_version = *next.meta.previous_version;
        next.meta.previous_version.reset();
        next.AddIgnored(failed);
        next.RemoveFromHistory(failed);
        next.phase = phase::Idle{};
        return;
    }

    LogWarn("Active root holds %s but state says %s; trusting the active root", marker->c_str(),
            next.meta.installed_version.c_str());
    next.meta.installed_version = *marker;
    next.AddToHistory(*marker);
    if (std::holds_alternative<phase::CanaryPending>(next.phase))
        next.phase = phase::Idle{};
}

void UpdateManager::HealDiskInvariants(UpdateState& next) {
    if (const auto* staged = std::get_if<phase::Staged>(&next.phase)) {
        const std::string staging = roots_.StagingRoot(staged->version);
        auto vr = VerifyContentRoot(staging, opt_.entry_file);
        if (!vr.is_ok()) {
            LogWarn("Dropping staged %s: %s", staged->version.c_str(), vr.message().c_str());
            RemoveQuietly(staging);
            next.phase = phase::Idle{};
        }
    }

    // Staging directories not referenced by the state are leftovers.
    const auto pending = next.PendingVersion();
    const std::string keep = pending ? VersionDirName(*pending) : std::string();
    std::error_code ec;
    for (fs::directory_iterator it(roots_.StagingBase(), ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string() != keep) {
            LogInfo("Removing stale staging %s", it->path().c_str());
            RemoveQuietly(it->path().string());
        }
    }

    const std::string backup = roots_.Resolve(next).backup;
    const bool has_backup = IsDirectory(backup);
    if (next.meta.previous_version && !has_backup) {
        LogWarn("Backup root for %s is gone", next.meta.previous_version->c_str());
        next.meta.previous_version.reset();
    } else if (!next.meta.previous_version && has_backup) {
        const auto marker = ReadVersionMarker(backup);
        if (std::holds_alternative<phase::CanaryPending>(next.phase) && marker &&
            !VersionComparator::Equivalent(*marker, next.meta.installed_version)) {
            next.meta.previous_version = marker;
        } else {
            LogInfo("Removing unreferenced backup root");
            RemoveQuietly(backup);
        }
    }
}

void UpdateManager::SeedActiveRoot(UpdateState& next, bool& active_changed) {
    const std::string active = roots_.ActiveRoot();
    const std::string bundle_version = bundle_.BundleVersion();

    if (IsDirectory(active)) {
        if (!ReadVersionMarker(active)) {
            auto r = WriteVersionMarker(active, next.meta.installed_version);
            if (!r.is_ok())
                LogWarn("Cannot mark active root: %s", r.message().c_str());
        }
        return;
    }

    if (!VersionComparator::Equivalent(next.meta.installed_version, bundle_version)) {
        LogWarn("Active root for %s is missing, reverting to bundled %s",
                next.meta.installed_version.c_str(), bundle_version.c_str());
        next.meta.installed_version = bundle_version;
        next.meta.previous_version.reset();
        next.RemoveIgnored(bundle_version);
        next.AddToHistory(bundle_version);
        if (std::holds_alternative<phase::CanaryPending>(next.phase))
            next.phase = phase::Idle{};
    }

    const std::string bundle_dir = bundle_.BundleContentDir();
    if (bundle_dir.empty() || !IsDirectory(bundle_dir)) {
        LogDebug("No bundled content to seed %s from", active.c_str());
        return;
    }

    ScopedTempDir seed;
    auto r = ScopedTempDir::Create(roots_.TombPrefix(), seed, opt_.dir_ops);
    std::string err;
    if (r.is_ok() && !CopyTree(bundle_dir, seed.Path(), err))
        r = Result::Fail(ErrorCode::TempDirError, err);
    if (r.is_ok())
        r = WriteVersionMarker(seed.Path(), bundle_version);
    if (r.is_ok())
        r = opt_.dir_ops->Rename(seed.Path(), active);
    if (!r.is_ok()) {
        LogError("Seeding %s from bundle failed: %s", active.c_str(), r.message().c_str());
        return;
    }
    seed.Release();
    active_changed = true;
    LogInfo("Seeded %s from bundled content %s", active.c_str(), bundle_version.c_str());
}

Result UpdateManager::LaunchRecovery() {
    std::optional<std::string> switched_to;
    Result result;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (recovered_)
            return Result::Ok();
        loaded_ = false;
        EnsureLoadedLocked();

        std::error_code ec;
        fs::create_directories(roots_.ContentDir(), ec);
        if (ec) {
            LogError("Cannot create %s: %s", roots_.ContentDir().c_str(), ec.message().c_str());
        }

        const fs::path content_dir(roots_.ContentDir());
        const int tombs = RemoveEntriesWithPrefix(content_dir.string(), ContentRootResolver::kTombPrefix);
        const int temps = RemoveEntriesWithPrefix(content_dir.string(), ContentRootResolver::kDownloadPrefix);
        if (tombs + temps > 0)
            LogInfo("Removed %d stale work directories", tombs + temps);

        UpdateState next = state_;
        if (const auto dl = next.DownloadingVersion()) {
            LogWarn("Download of %s did not finish before restart", dl->c_str());
            next.phase = PhaseAfterDownload(next);
        }

        bool active_changed = false;
        RepairInterruptedSwap(next, active_changed);
        HealDiskInvariants(next);
        SeedActiveRoot(next, active_changed);
        for (const auto& repair : HealState(next)) {
            LogWarn("Update state repaired: %s", repair.c_str());
        }

        // Always written: the first launch creates the record here.
        if (!SameRecord(next, state_))
            LogInfo("Update state adjusted during launch recovery");
        auto pr = PersistLocked(next);
        if (!pr.is_ok()) {
            LogError("Cannot persist recovered state: %s", pr.message().c_str());
            state_ = std::move(next);
            download_in_progress_.store(false);
        }
        if (active_changed)
            switched_to = roots_.ActiveRoot();
        recovered_ = true;

        if (std::holds_alternative<phase::Staged>(state_.phase)) {
            LogInfo("Applying staged update on launch");
            std::optional<std::string> installed_to;
            result = InstallLocked(installed_to);
            if (!result.is_ok()) {
                LogError("Launch install failed: %s", result.message().c_str());
            } else if (installed_to) {
                switched_to = installed_to;
            }
        }
    }
    SwitchedNotify(switched_to);
    return result;
}

// ---------------------------------------------------------------------------
// queries

VersionInfo UpdateManager::GetVersionInfo() const {
    std::lock_guard<std::mutex> lock(mu_);
    VersionInfo info;
    info.bundle_version = bundle_.BundleVersion();
    info.installed_version = state_.meta.installed_version;
    info.previous_version = state_.meta.previous_version;
    info.canary_version = state_.CanaryVersion();
    info.pending_version = state_.PendingVersion();
    info.downloading_version = state_.DownloadingVersion();
    info.has_pending_update = info.pending_version.has_value();
    info.pending_update_ready = info.has_pending_update;
    info.download_in_progress = state_.DownloadInProgress();
    info.phase = std::string(PhaseName(state_.phase));
    const ContentRoots roots = roots_.Resolve(state_);
    info.active_root = roots.active;
    info.staging_root = roots.staging;
    info.ignore_list.assign(state_.meta.ignore_list.begin(), state_.meta.ignore_list.end());
    return info;
}

std::vector<std::string> UpdateManager::GetIgnoreList() const {
    std::lock_guard<std::mutex> lock(mu_);
    return {state_.meta.ignore_list.begin(), state_.meta.ignore_list.end()};
}

std::vector<std::string> UpdateManager::GetVersionHistory() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_.meta.version_history;
}

LifecyclePhase UpdateManager::Phase() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_.phase;
}

UpdateState UpdateManager::Snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

// ---------------------------------------------------------------------------
// ignore list

Result UpdateManager::AddToIgnoreList(const std::string& version) {
    if (version.empty())
        return Result::Fail(ErrorCode::VersionRequired, "Version is required");

    std::lock_guard<std::mutex> lock(mu_);
    EnsureLoadedLocked();

    if (VersionComparator::Equivalent(version, state_.meta.installed_version)) {
        return Result::Fail(ErrorCode::VersionNotEligible,
                            "Installed version " + version + " cannot be ignored");
    }

    UpdateState next = state_;
    next.AddIgnored(version);

    std::optional<std::string> drop_staging;
    if (auto* staged = std::get_if<phase::Staged>(&next.phase);
        staged && VersionComparator::Equivalent(staged->version, version)) {
        drop_staging = roots_.StagingRoot(staged->version);
        next.phase = phase::Idle{};
    } else if (auto* dl = std::get_if<phase::Downloading>(&next.phase)) {
        if (dl->prior_staged && VersionComparator::Equivalent(*dl->prior_staged, version)) {
            drop_staging = roots_.StagingRoot(*dl->prior_staged);
            dl->prior_staged.reset();
        }
        if (VersionComparator::Equivalent(dl->version, version))
            next.phase = PhaseAfterDownload(next);
    }

    auto r = PersistLocked(std::move(next));
    if (!r.is_ok())
        return r;
    if (drop_staging)
        RemoveQuietly(*drop_staging);

    LogInfo("Version %s added to ignore list", version.c_str());
    return Result::Ok();
}

Result UpdateManager::RemoveFromIgnoreList(const std::string& version) {
    if (version.empty())
        return Result::Fail(ErrorCode::VersionRequired, "Version is required");

    std::lock_guard<std::mutex> lock(mu_);
    EnsureLoadedLocked();

    UpdateState next = state_;
    if (!next.RemoveIgnored(version))
        return Result::Ok();

    auto r = PersistLocked(std::move(next));
    if (!r.is_ok())
        return r;
    LogInfo("Version %s removed from ignore list", version.c_str());
    return Result::Ok();
}

Result UpdateManager::ClearIgnoreList() {
    std::lock_guard<std::mutex> lock(mu_);
    EnsureLoadedLocked();

    if (state_.meta.ignore_list.empty())
        return Result::Ok();

    UpdateState next = state_;
    next.meta.ignore_list.clear();
    auto r = PersistLocked(std::move(next));
    if (!r.is_ok())
        return r;
    LogInfo("Ignore list cleared");
    return Result::Ok();
}

} // namespace hotupdate
