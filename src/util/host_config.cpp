#include "util/host_config.hpp"

#include "util/json_utils.hpp"

#include <filesystem>

namespace hotupdate {

namespace {
constexpr const char kDefaultStateFileName[] = "hot_updates_state.json";
} // namespace

Result HostConfig::LoadFromFile(const std::string& path, HostConfig& out) {
    out = HostConfig{};

    nlohmann::json j;
    std::string err;
    if (!json_utils::LoadJsonObjectFromFile(path, j, err)) {
        return Result::Fail(ErrorCode::ConfigError, err);
    }

    json_utils::GetStringIfPresent(j, "content_dir", out.content_dir);
    json_utils::GetStringIfPresent(j, "bundle_version", out.bundle_version);
    json_utils::GetStringIfPresent(j, "bundle_www_dir", out.bundle_www_dir);
    json_utils::GetStringIfPresent(j, "entry_file", out.entry_file);
    json_utils::GetStringIfPresent(j, "state_file", out.state_file);
    json_utils::GetBoolIfPresent(j, "debug_api", out.debug_api);
    if (j.contains("max_extracted_bytes") &&
        !json_utils::GetUint64IfPresent(j, "max_extracted_bytes", out.max_extracted_bytes)) {
        return Result::Fail(ErrorCode::ConfigError, "max_extracted_bytes must be a non-negative integer");
    }

    std::string level;
    if (json_utils::GetStringIfPresent(j, "log_level", level)) {
        auto parsed = ParseLogLevel(level);
        if (!parsed) {
            return Result::Fail(ErrorCode::ConfigError, "invalid log_level: " + level);
        }
        out.log_level = *parsed;
    }

    if (out.content_dir.empty()) {
        return Result::Fail(ErrorCode::ConfigError, "config missing content_dir: " + path);
    }
    if (out.bundle_version.empty()) {
        return Result::Fail(ErrorCode::ConfigError, "config missing bundle_version: " + path);
    }
    if (out.entry_file.empty() || out.entry_file.find('/') != std::string::npos) {
        return Result::Fail(ErrorCode::ConfigError,
                            "entry_file must be a plain file name: " + out.entry_file);
    }
    if (out.state_file.empty()) {
        out.state_file = (std::filesystem::path(out.content_dir) / kDefaultStateFileName).string();
    }

    return Result::Ok();
}

} // namespace hotupdate
