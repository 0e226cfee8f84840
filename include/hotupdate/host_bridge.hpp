#pragma once

#include "hotupdate/update_manager.hpp"
#include "hotupdate/update_service.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace hotupdate {

// Action dispatcher for the host UI bridge. Arguments arrive as a JSON
// array; every handled action answers exactly once through the callback,
// with {"ok":true,...} or {"error":{"code","message"}}.
class HostBridge {
public:
    using Callback = std::function<void(const nlohmann::json&)>;

    struct Options {
        // Exposes addToIgnoreList / removeFromIgnoreList / clearIgnoreList.
        bool debug_api = false;
    };

    HostBridge(UpdateManager& manager, UpdateService& service);
    HostBridge(UpdateManager& manager, UpdateService& service, Options opt);

    // Returns false for unknown (or disabled) actions; the callback is not
    // invoked then. getUpdate answers from the service worker thread.
    bool Execute(const std::string& action, const nlohmann::json& args, Callback done);

    static nlohmann::json ErrorJson(const Result& r);
    static nlohmann::json VersionInfoJson(const VersionInfo& info);

private:
    void GetUpdate(const nlohmann::json& args, Callback done);
    void CheckForUpdate(const nlohmann::json& args, const Callback& done);
    void ForceUpdate(const Callback& done);
    void Canary(const nlohmann::json& args, const Callback& done);
    void RollbackAction(const Callback& done);
    void CancelDownload(const Callback& done);
    void EditIgnoreList(const std::string& action, const nlohmann::json& args, const Callback& done);

    nlohmann::json IgnoreListJson() const;

    UpdateManager& manager_;
    UpdateService& service_;
    Options opt_;
};

} // namespace hotupdate
