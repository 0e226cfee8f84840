#include "hotupdate/content_switch_notifier.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <exception>

namespace hotupdate {

void ContentSwitchNotifier::AddListener(IContentSwitchListener* listener) {
    if (!listener)
        return;
    std::lock_guard<std::mutex> lock(mu_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void ContentSwitchNotifier::RemoveListener(IContentSwitchListener* listener) {
    std::lock_guard<std::mutex> lock(mu_);
    std::erase(listeners_, listener);
}

void ContentSwitchNotifier::Notify(const std::string& active_root) {
    std::vector<IContentSwitchListener*> snapshot;
    {
        std::lock_guard<std::mutex> lock(mu_);
        snapshot = listeners_;
    }

    LogInfo("Content switched to %s", active_root.c_str());
    for (auto* listener : snapshot) {
        try {
            listener->OnContentSwitched(active_root);
        } catch (const std::exception& e) {
            LogError("Content switch listener failed: %s", e.what());
        }
    }
}

} // namespace hotupdate
