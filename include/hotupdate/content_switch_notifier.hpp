#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace hotupdate {

class IContentSwitchListener {
public:
    virtual ~IContentSwitchListener() = default;
    // The host should reload its web view from `active_root`.
    virtual void OnContentSwitched(const std::string& active_root) = 0;
};

// Listeners are not owned and must outlive their registration.
class ContentSwitchNotifier {
public:
    void AddListener(IContentSwitchListener* listener);
    void RemoveListener(IContentSwitchListener* listener);

    void Notify(const std::string& active_root);

private:
    std::mutex mu_;
    std::vector<IContentSwitchListener*> listeners_;
};

} // namespace hotupdate
