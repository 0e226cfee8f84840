#include "hotupdate/content_roots.hpp"

#include "util/path_utils.hpp"

namespace hotupdate {

ContentRootResolver::ContentRootResolver(std::string content_dir)
    : content_dir_(std::move(content_dir)) {
    while (content_dir_.size() > 1 && content_dir_.back() == '/') content_dir_.pop_back();
}

std::string ContentRootResolver::Join(const std::string& name) const {
    if (content_dir_.empty()) return name;
    if (content_dir_ == "/") return "/" + name;
    return content_dir_ + "/" + name;
}

std::string ContentRootResolver::ActiveRoot() const { return Join(kActiveName); }

std::string ContentRootResolver::BackupRoot() const { return Join(kBackupName); }

std::string ContentRootResolver::StagingBase() const { return Join(kStagingName); }

std::string ContentRootResolver::StagingRoot(const std::string& version) const {
    return StagingBase() + "/" + VersionDirName(version);
}

std::string ContentRootResolver::DownloadTempPrefix() const { return Join(kDownloadPrefix); }

std::string ContentRootResolver::TombPrefix() const { return Join(kTombPrefix); }

ContentRoots ContentRootResolver::Resolve(const UpdateState& state) const {
    ContentRoots roots;
    roots.active = ActiveRoot();
    roots.backup = BackupRoot();
    if (auto pending = state.PendingVersion()) {
        roots.staging = StagingRoot(*pending);
    }
    return roots;
}

} // namespace hotupdate
