#include "hotupdate/host_bridge.hpp"

#include "util/logger.hpp"

namespace hotupdate {

namespace {

using nlohmann::json;

json OkJson() {
    return json{{"ok", true}};
}

json OptionalJson(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

// First argument as a string; empty when absent or not a string.
std::string VersionArg(const json& args) {
    if (args.is_array() && !args.empty() && args[0].is_string())
        return args[0].get<std::string>();
    if (args.is_string())
        return args.get<std::string>();
    return {};
}

void Reply(const HostBridge::Callback& done, const json& payload) {
    if (done)
        done(payload);
}

} // namespace

HostBridge::HostBridge(UpdateManager& manager, UpdateService& service)
    : HostBridge(manager, service, Options{}) {}

HostBridge::HostBridge(UpdateManager& manager, UpdateService& service, Options opt)
    : manager_(manager), service_(service), opt_(opt) {}

json HostBridge::ErrorJson(const Result& r) {
    return json{{"error", {{"code", std::string(ErrorCodeName(r.code))}, {"message", r.message()}}}};
}

json HostBridge::VersionInfoJson(const VersionInfo& info) {
    json j = OkJson();
    j["appBundleVersion"] = info.bundle_version;
    j["installedVersion"] = info.installed_version;
    j["previousVersion"] = OptionalJson(info.previous_version);
    j["canaryVersion"] = OptionalJson(info.canary_version);
    j["pendingVersion"] = OptionalJson(info.pending_version);
    j["downloadingVersion"] = OptionalJson(info.downloading_version);
    j["hasPendingUpdate"] = info.has_pending_update;
    j["pendingUpdateReady"] = info.pending_update_ready;
    j["downloadInProgress"] = info.download_in_progress;
    j["state"] = info.phase;
    j["activeRoot"] = info.active_root;
    j["stagingRoot"] = OptionalJson(info.staging_root);
    j["ignoreList"] = info.ignore_list;
    return j;
}

json HostBridge::IgnoreListJson() const {
    json j = OkJson();
    j["versions"] = manager_.GetIgnoreList();
    return j;
}

bool HostBridge::Execute(const std::string& action, const json& args, Callback done) {
    LogDebug("Bridge action %s", action.c_str());

    if (action == "getUpdate") {
        GetUpdate(args, std::move(done));
    } else if (action == "checkForUpdate") {
        CheckForUpdate(args, done);
    } else if (action == "forceUpdate") {
        ForceUpdate(done);
    } else if (action == "canary") {
        Canary(args, done);
    } else if (action == "rollback") {
        RollbackAction(done);
    } else if (action == "cancelDownload") {
        CancelDownload(done);
    } else if (action == "getVersionInfo") {
        Reply(done, VersionInfoJson(manager_.GetVersionInfo()));
    } else if (action == "getIgnoreList") {
        Reply(done, IgnoreListJson());
    } else if (action == "getVersionHistory") {
        json j = OkJson();
        j["versions"] = manager_.GetVersionHistory();
        Reply(done, j);
    } else if (opt_.debug_api && (action == "addToIgnoreList" || action == "removeFromIgnoreList" ||
                                  action == "clearIgnoreList")) {
        EditIgnoreList(action, args, done);
    } else {
        LogWarn("Unknown bridge action: %s", action.c_str());
        return false;
    }
    return true;
}

void HostBridge::GetUpdate(const json& args, Callback done) {
    const json* data = nullptr;
    if (args.is_array() && !args.empty() && args[0].is_object()) {
        data = &args[0];
    } else if (args.is_object()) {
        data = &args;
    }
    if (!data) {
        Reply(done, ErrorJson(Result::Fail(ErrorCode::UpdateDataRequired, "Update data is required")));
        return;
    }

    UpdateRequest req;
    if (auto it = data->find("url"); it != data->end() && it->is_string())
        req.url = it->get<std::string>();
    if (auto it = data->find("version"); it != data->end() && it->is_string())
        req.version = it->get<std::string>();
    if (auto it = data->find("sha256"); it != data->end() && it->is_string())
        req.sha256 = it->get<std::string>();

    const std::string version = req.version;
    auto r = service_.GetUpdateAsync(std::move(req), [done, version](const Result& res,
                                                                   const UpdateOutcome& out) {
        if (!res.is_ok()) {
            Reply(done, ErrorJson(res));
            return;
        }
        json j = OkJson();
        j["version"] = version;
        j["result"] = std::string(CheckOutcomeName(out.check));
        j["staged"] = out.staged;
        Reply(done, j);
    });
    if (!r.is_ok())
        Reply(done, ErrorJson(r));
}

void HostBridge::CheckForUpdate(const json& args, const Callback& done) {
    const std::string version = VersionArg(args);
    CheckOutcome outcome = CheckOutcome::UpToDate;
    auto r = manager_.CheckAvailable(version, outcome);
    if (!r.is_ok()) {
        Reply(done, ErrorJson(r));
        return;
    }
    json j = OkJson();
    j["version"] = version;
    j["result"] = std::string(CheckOutcomeName(outcome));
    j["updateAvailable"] = outcome == CheckOutcome::UpdateAvailable;
    Reply(done, j);
}

void HostBridge::ForceUpdate(const Callback& done) {
    auto r = manager_.Install();
    if (!r.is_ok()) {
        Reply(done, ErrorJson(r));
        return;
    }
    const auto info = manager_.GetVersionInfo();
    json j = OkJson();
    j["installedVersion"] = info.installed_version;
    j["previousVersion"] = OptionalJson(info.previous_version);
    j["activeRoot"] = info.active_root;
    Reply(done, j);
}

void HostBridge::Canary(const json& args, const Callback& done) {
    auto r = manager_.ConfirmCanary(VersionArg(args));
    if (!r.is_ok()) {
        Reply(done, ErrorJson(r));
        return;
    }
    const auto info = manager_.GetVersionInfo();
    json j = OkJson();
    j["installedVersion"] = info.installed_version;
    j["canaryVersion"] = OptionalJson(info.canary_version);
    Reply(done, j);
}

void HostBridge::RollbackAction(const Callback& done) {
    auto r = manager_.Rollback();
    if (!r.is_ok()) {
        Reply(done, ErrorJson(r));
        return;
    }
    const auto info = manager_.GetVersionInfo();
    json j = OkJson();
    j["installedVersion"] = info.installed_version;
    j["ignoreList"] = info.ignore_list;
    Reply(done, j);
}

void HostBridge::CancelDownload(const Callback& done) {
    const bool was_downloading = manager_.IsDownloadInProgress();
    service_.Cancel();
    json j = OkJson();
    j["cancelled"] = was_downloading;
    Reply(done, j);
}

void HostBridge::EditIgnoreList(const std::string& action, const json& args, const Callback& done) {
    Result r;
    if (action == "addToIgnoreList") {
        r = manager_.AddToIgnoreList(VersionArg(args));
    } else if (action == "removeFromIgnoreList") {
        r = manager_.RemoveFromIgnoreList(VersionArg(args));
    } else {
        r = manager_.ClearIgnoreList();
    }
    if (!r.is_ok()) {
        Reply(done, ErrorJson(r));
        return;
    }
    Reply(done, IgnoreListJson());
}

} // namespace hotupdate
