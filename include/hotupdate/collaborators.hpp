#pragma once

#include "hotupdate/progress.hpp"
#include "util/result.hpp"

#include <atomic>
#include <string>
#include <string_view>

namespace hotupdate {

// Transport seam. Implementations write the package to `dest_path` and fail
// with UrlRequired, HttpError or DownloadFailed. `cancel` is polled while
// streaming; a cancelled fetch fails with DownloadCancelled.
class IFetcher {
public:
    virtual ~IFetcher() = default;
    virtual Result Fetch(const std::string& url,
                         const std::string& dest_path,
                         std::string_view version,
                         IProgress* progress,
                         const std::atomic_bool* cancel) = 0;
};

// Unpacks a downloaded package into `dest_dir`; fails with TempDirError or
// ExtractionFailed.
class IExtractor {
public:
    virtual ~IExtractor() = default;
    virtual Result Extract(const std::string& archive_path, const std::string& dest_dir) = 0;
};

// What the application package itself ships.
class IBundleInfoProvider {
public:
    virtual ~IBundleInfoProvider() = default;
    virtual std::string BundleVersion() const = 0;
    // Empty when the host serves bundled content itself and no copy exists.
    virtual std::string BundleContentDir() const = 0;
};

class StaticBundleInfo final : public IBundleInfoProvider {
public:
    StaticBundleInfo(std::string version, std::string content_dir)
        : version_(std::move(version)), content_dir_(std::move(content_dir)) {}

    std::string BundleVersion() const override { return version_; }
    std::string BundleContentDir() const override { return content_dir_; }

private:
    std::string version_;
    std::string content_dir_;
};

} // namespace hotupdate
