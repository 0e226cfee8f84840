#include "hotupdate/state_store.hpp"

#include "io/atomic_file.hpp"
#include "util/json_utils.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <sys/stat.h>

namespace hotupdate {

namespace {

constexpr int kSchemaVersion = 1;

constexpr const char kInstalledVersion[] = "hot_updates_installed_version";
constexpr const char kPendingVersion[] = "hot_updates_pending_version";
constexpr const char kHasPending[] = "hot_updates_has_pending";
constexpr const char kPendingReady[] = "hot_updates_pending_ready";
constexpr const char kPreviousVersion[] = "hot_updates_previous_version";
constexpr const char kIgnoreList[] = "hot_updates_ignore_list";
constexpr const char kVersionHistory[] = "hot_updates_version_history";
constexpr const char kCanaryVersion[] = "hot_updates_canary_version";
constexpr const char kDownloadInProgress[] = "hot_updates_download_in_progress";
constexpr const char kDownloadVersion[] = "hot_updates_download_version";
constexpr const char kSchema[] = "hot_updates_schema";

nlohmann::json OptionalToJson(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

bool FileExists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace

nlohmann::json EncodeState(const UpdateState& state) {
    const auto pending = state.PendingVersion();
    const bool has_pending = pending.has_value();

    nlohmann::json j = nlohmann::json::object();
    j[kSchema] = kSchemaVersion;
    j[kInstalledVersion] = state.meta.installed_version;
    j[kPendingVersion] = OptionalToJson(pending);
    j[kHasPending] = has_pending;
    j[kPendingReady] = has_pending;
    j[kPreviousVersion] = OptionalToJson(state.meta.previous_version);
    j[kIgnoreList] = state.meta.ignore_list;
    j[kVersionHistory] = state.meta.version_history;
    j[kCanaryVersion] = OptionalToJson(state.CanaryVersion());
    j[kDownloadInProgress] = state.DownloadInProgress();
    j[kDownloadVersion] = OptionalToJson(state.DownloadingVersion());
    return j;
}

std::expected<UpdateState, std::string> DecodeState(const nlohmann::json& j,
                                                    const std::string& bundle_version) {
    if (!j.is_object())
        return std::unexpected("state record must be a JSON object");

    if (auto it = j.find(kSchema); it != j.end()) {
        if (!it->is_number_integer() || it->get<int>() > kSchemaVersion)
            return std::unexpected("unsupported state schema");
    }

    UpdateState s;
    s.meta.installed_version =
        json_utils::GetOptionalString(j, kInstalledVersion).value_or(bundle_version);
    s.meta.previous_version = json_utils::GetOptionalString(j, kPreviousVersion);
    for (auto& v : json_utils::GetStringArray(j, kIgnoreList)) {
        if (!v.empty()) s.AddIgnored(v);
    }
    for (auto& v : json_utils::GetStringArray(j, kVersionHistory)) {
        if (!v.empty()) s.AddToHistory(v);
    }
    if (s.meta.version_history.empty()) {
        s.AddToHistory(bundle_version);
        s.AddToHistory(s.meta.installed_version);
    }

    bool has_pending = false;
    bool pending_ready = false;
    bool downloading = false;
    json_utils::GetBoolIfPresent(j, kHasPending, has_pending);
    json_utils::GetBoolIfPresent(j, kPendingReady, pending_ready);
    json_utils::GetBoolIfPresent(j, kDownloadInProgress, downloading);

    auto pending = json_utils::GetOptionalString(j, kPendingVersion);
    if (!(has_pending && pending_ready)) pending.reset();
    const auto canary = json_utils::GetOptionalString(j, kCanaryVersion);
    const auto download = json_utils::GetOptionalString(j, kDownloadVersion);

    // Flags written by older records may combine; the most advanced wins.
    if (canary) {
        s.phase = phase::CanaryPending{*canary};
    } else if (downloading && download) {
        s.phase = phase::Downloading{*download, pending};
    } else if (pending) {
        s.phase = phase::Staged{*pending};
    }
    return s;
}

Result JsonFileStateStore::Load(UpdateState& out) {
    if (!FileExists(path_)) {
        LogInfo("No update state at %s, starting from bundle version %s",
                path_.c_str(), bundle_version_.c_str());
        out = UpdateState::Initial(bundle_version_);
        return Result::Ok();
    }

    nlohmann::json j;
    std::string err;
    if (!json_utils::LoadJsonObjectFromFile(path_, j, err)) {
        LogWarn("Update state unreadable, resetting: %s", err.c_str());
        out = UpdateState::Initial(bundle_version_);
        return Result::Fail(ErrorCode::StateIoError, err);
    }

    auto decoded = DecodeState(j, bundle_version_);
    if (!decoded) {
        LogWarn("Update state rejected, resetting: %s", decoded.error().c_str());
        out = UpdateState::Initial(bundle_version_);
        return Result::Fail(ErrorCode::StateIoError, decoded.error());
    }

    out = std::move(*decoded);
    for (const auto& repair : HealState(out)) {
        LogWarn("Update state repaired: %s", repair.c_str());
    }
    return Result::Ok();
}

Result JsonFileStateStore::Save(const UpdateState& state) {
    std::string text;
    try {
        text = EncodeState(state).dump(2);
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(ErrorCode::StateIoError, std::string("encode state: ") + e.what());
    }
    text.push_back('\n');

    auto r = WriteFileAtomically(path_, text);
    if (!r.is_ok()) {
        LogError("Saving update state failed: %s", r.message().c_str());
        return r;
    }
    LogDebug("Update state saved: installed=%s phase=%s",
             state.meta.installed_version.c_str(), std::string(PhaseName(state.phase)).c_str());
    return Result::Ok();
}

} // namespace hotupdate
