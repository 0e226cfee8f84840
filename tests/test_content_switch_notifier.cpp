#include <gtest/gtest.h>

#include "hotupdate/content_switch_notifier.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace hotupdate {
namespace {

class RecordingListener final : public IContentSwitchListener {
public:
    void OnContentSwitched(const std::string& active_root) override { roots.push_back(active_root); }
    std::vector<std::string> roots;
};

class ThrowingListener final : public IContentSwitchListener {
public:
    void OnContentSwitched(const std::string&) override { throw std::runtime_error("web view gone"); }
};

TEST(ContentSwitchNotifierTest, NotifiesEveryListenerOnce) {
    ContentSwitchNotifier notifier;
    RecordingListener a;
    RecordingListener b;
    notifier.AddListener(&a);
    notifier.AddListener(&b);
    notifier.AddListener(&a);

    notifier.Notify("/data/www");
    EXPECT_EQ(a.roots, std::vector<std::string>{"/data/www"});
    EXPECT_EQ(b.roots, std::vector<std::string>{"/data/www"});
}

TEST(ContentSwitchNotifierTest, RemovedListenerIsSkipped) {
    ContentSwitchNotifier notifier;
    RecordingListener a;
    notifier.AddListener(&a);
    notifier.RemoveListener(&a);
    notifier.Notify("/data/www");
    EXPECT_TRUE(a.roots.empty());
}

TEST(ContentSwitchNotifierTest, ThrowingListenerDoesNotStopOthers) {
    ContentSwitchNotifier notifier;
    ThrowingListener bad;
    RecordingListener good;
    notifier.AddListener(&bad);
    notifier.AddListener(&good);
    notifier.AddListener(nullptr);

    EXPECT_NO_THROW(notifier.Notify("/data/www"));
    EXPECT_EQ(good.roots.size(), 1u);
}

} // namespace
} // namespace hotupdate
