#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace hotupdate {

struct HostConfig {
    // Directory owned by the updater: active, backup, staging and temp roots.
    std::string content_dir;
    // Version and location of the web content shipped inside the app package.
    std::string bundle_version;
    std::string bundle_www_dir;
    // File every content root must contain to be considered loadable.
    std::string entry_file = "index.html";
    std::string state_file;
    LogLevel log_level = LogLevel::Info;
    // Cap on the unpacked size of an update package; 0 disables it.
    std::uint64_t max_extracted_bytes = 0;
    // Enables the ignore-list editing actions on the bridge.
    bool debug_api = false;

    static Result LoadFromFile(const std::string& path, HostConfig& out);
};

} // namespace hotupdate
