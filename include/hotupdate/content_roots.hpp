#pragma once

#include "hotupdate/update_state.hpp"

#include <optional>
#include <string>

namespace hotupdate {

struct ContentRoots {
    std::string active;
    std::string backup;
    std::optional<std::string> staging;
};

// Maps versions and lifecycle state onto directories below `content_dir`.
// Pure: nothing here touches the filesystem.
class ContentRootResolver {
public:
    static constexpr const char* kActiveName = "www";
    static constexpr const char* kBackupName = "www_previous";
    static constexpr const char* kStagingName = "pending_update";
    static constexpr const char* kDownloadPrefix = "temp_new_download-";
    static constexpr const char* kTombPrefix = ".swap-";
    static constexpr const char* kMarkerName = ".hotupdate_version";

    explicit ContentRootResolver(std::string content_dir);

    const std::string& ContentDir() const { return content_dir_; }

    std::string ActiveRoot() const;
    std::string BackupRoot() const;
    std::string StagingBase() const;
    std::string StagingRoot(const std::string& version) const;
    // mkdtemp-style prefix for per-download work directories.
    std::string DownloadTempPrefix() const;
    std::string TombPrefix() const;

    ContentRoots Resolve(const UpdateState& state) const;

private:
    std::string Join(const std::string& name) const;

    std::string content_dir_;
};

} // namespace hotupdate
