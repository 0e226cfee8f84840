#include "hotupdate/local_fetcher.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace hotupdate {

namespace {

constexpr const char kFileScheme[] = "file://";

bool IsCancelled(const std::atomic_bool* cancel) {
    return cancel && cancel->load(std::memory_order_relaxed);
}

Result WriteAll(int fd, const char* data, size_t len) {
    size_t off = 0;
    while (off < len) {
        const ssize_t n = ::write(fd, data + off, len - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(ErrorCode::DownloadFailed, std::string("write failed: ") + std::strerror(err));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

} // namespace

std::string LocalFetcher::LocalPathFromUrl(const std::string& url) {
    if (url.rfind(kFileScheme, 0) == 0) {
        std::string path = url.substr(sizeof(kFileScheme) - 1);
        // file://localhost/path
        if (path.rfind("localhost/", 0) == 0) path.erase(0, std::strlen("localhost"));
        return (!path.empty() && path.front() == '/') ? path : std::string();
    }
    if (!url.empty() && url.front() == '/') return url;
    return {};
}

Result LocalFetcher::Fetch(const std::string& url,
                           const std::string& dest_path,
                           std::string_view version,
                           IProgress* progress,
                           const std::atomic_bool* cancel) {
    if (url.empty()) return Result::Fail(ErrorCode::UrlRequired, "URL is required");

    const std::string src = LocalPathFromUrl(url);
    if (src.empty()) {
        return Result::Fail(ErrorCode::DownloadFailed, "unsupported URL scheme: " + url);
    }

    Fd in;
    const int in_fd = ::open(src.c_str(), O_RDONLY | O_CLOEXEC);
    if (in_fd < 0) {
        const int err = errno;
        return Result::Fail(ErrorCode::DownloadFailed,
                            "Download failed: " + src + ": " + std::strerror(err));
    }
    in.Reset(in_fd);

    struct stat st{};
    std::uint64_t total = 0;
    if (::fstat(in.Get(), &st) == 0 && S_ISREG(st.st_mode)) {
        total = static_cast<std::uint64_t>(st.st_size);
    } else {
        return Result::Fail(ErrorCode::DownloadFailed, "Download failed: not a regular file: " + src);
    }

    Fd out;
    const int out_fd = ::open(dest_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (out_fd < 0) {
        const int err = errno;
        return Result::Fail(ErrorCode::TempDirError,
                            "cannot create " + dest_path + ": " + std::strerror(err));
    }
    out.Reset(out_fd);

    LogInfo("Fetching %s (%llu bytes)", src.c_str(), (unsigned long long)total);

    std::vector<char> buf(chunk_bytes_ > 0 ? chunk_bytes_ : 64 * 1024);
    std::uint64_t done = 0;
    while (true) {
        if (IsCancelled(cancel)) {
            return Result::Fail(ErrorCode::DownloadCancelled, "download cancelled");
        }
        const ssize_t n = ::read(in.Get(), buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(ErrorCode::DownloadFailed,
                                "Download failed: read " + src + ": " + std::strerror(err));
        }
        auto wr = WriteAll(out.Get(), buf.data(), static_cast<size_t>(n));
        if (!wr.is_ok()) return wr;
        done += static_cast<std::uint64_t>(n);

        if (progress) {
            ProgressEvent event{};
            event.version = version;
            event.done_bytes = done;
            event.total_bytes = total;
            progress->OnProgress(event);
        }
    }

    auto fr = out.Fsync();
    if (!fr.is_ok()) return Result::Fail(ErrorCode::DownloadFailed, fr.message());
    return Result::Ok();
}

} // namespace hotupdate
