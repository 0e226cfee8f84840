#include "archive/archive_extractor.hpp"
#include "hotupdate/collaborators.hpp"
#include "hotupdate/content_roots.hpp"
#include "hotupdate/content_switch_notifier.hpp"
#include "hotupdate/host_bridge.hpp"
#include "hotupdate/local_fetcher.hpp"
#include "hotupdate/progress.hpp"
#include "hotupdate/state_store.hpp"
#include "hotupdate/update_manager.hpp"
#include "hotupdate/update_service.hpp"
#include "system/signals.hpp"
#include "util/host_config.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <string>
#include <thread>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/hot-updater/hot-updater.json";
constexpr const char *kConfigEnv = "HOT_UPDATER_CONFIG";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] -a <action> [-j <json-args>] [-v]\n"
        "\n"
        "Options:\n"
        "  -c, --config    Config file (default $%s, then %s)\n"
        "  -a, --action    getUpdate, checkForUpdate, forceUpdate, canary, rollback,\n"
        "                  cancelDownload, getVersionInfo, getIgnoreList, getVersionHistory\n"
        "                  (debug_api: addToIgnoreList, removeFromIgnoreList, clearIgnoreList)\n"
        "  -j, --args      Action arguments as a JSON array (default [])\n"
        "  -v, --verbose   Debug logging\n"
        "  -h, --help      Show this help\n",
        argv, kConfigEnv, kDefaultConfigPath);
}

// Prints the content root the host should reload from.
class StderrSwitchListener final : public hotupdate::IContentSwitchListener {
public:
    void OnContentSwitched(const std::string &active_root) override {
        std::fprintf(stderr, "RELOAD: %s\n", active_root.c_str());
    }
};

} // namespace

int main(int argc, char **argv) {
    hotupdate::InstallSignalHandlers();

    std::string config_path;
    std::string action;
    std::string args_text = "[]";
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"action", required_argument, nullptr, 'a'},
        {"args", required_argument, nullptr, 'j'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvc:a:j:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'a':
                action = optarg;
                break;

            case 'j':
                args_text = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (action.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    if (config_path.empty()) {
        const char *env = std::getenv(kConfigEnv);
        config_path = (env && *env) ? env : kDefaultConfigPath;
    }

    hotupdate::HostConfig cfg;
    if (auto r = hotupdate::HostConfig::LoadFromFile(config_path, cfg); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    hotupdate::Logger::Instance().SetLevel(verbose ? hotupdate::LogLevel::Debug : cfg.log_level);

    nlohmann::json args = nlohmann::json::parse(args_text, nullptr, false);
    if (args.is_discarded()) {
        std::fprintf(stderr, "ERROR: invalid JSON arguments: %s\n", args_text.c_str());
        return 2;
    }

    hotupdate::StaticBundleInfo bundle(cfg.bundle_version, cfg.bundle_www_dir);
    hotupdate::JsonFileStateStore store(cfg.state_file, cfg.bundle_version);
    hotupdate::ContentSwitchNotifier notifier;
    StderrSwitchListener listener;
    notifier.AddListener(&listener);

    hotupdate::UpdateManager::Options manager_opt;
    manager_opt.entry_file = cfg.entry_file;
    hotupdate::UpdateManager manager(hotupdate::ContentRootResolver(cfg.content_dir), store, bundle,
                                     notifier, manager_opt);

    if (auto r = manager.LaunchRecovery(); !r.ok) {
        LogWarn("Launch recovery: %s", r.msg.c_str());
    }

    hotupdate::LocalFetcher fetcher;
    hotupdate::LibArchiveExtractor::Options extractor_opt;
    extractor_opt.max_total_bytes = cfg.max_extracted_bytes;
    hotupdate::LibArchiveExtractor extractor(extractor_opt);
    hotupdate::LogProgress progress;
    hotupdate::UpdateService service(manager, fetcher, extractor, &progress);

    hotupdate::HostBridge::Options bridge_opt;
    bridge_opt.debug_api = cfg.debug_api;
    hotupdate::HostBridge bridge(manager, service, bridge_opt);

    nlohmann::json reply;
    std::atomic_bool answered{false};
    const bool handled = bridge.Execute(action, args, [&](const nlohmann::json &j) {
        reply = j;
        answered.store(true);
    });
    if (!handled) {
        std::fprintf(stderr, "ERROR: unknown action: %s\n", action.c_str());
        return 2;
    }

    while (!answered.load()) {
        if (hotupdate::g_cancel.load()) {
            service.Cancel();
            hotupdate::g_cancel.store(false);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    service.Wait();

    std::printf("%s\n", reply.dump().c_str());
    return reply.contains("error") ? 1 : 0;
}
