#include "io/atomic_file.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace hotupdate {

namespace {

Result WriteAllToFd(int fd, std::string_view data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            return Result::Fail(ErrorCode::StateIoError, std::string("write failed: ") + std::strerror(err));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

// Unlinks the temp file unless Release()d.
class TempSibling {
public:
    explicit TempSibling(std::string path) : path_(std::move(path)) {}
    TempSibling(const TempSibling&) = delete;
    TempSibling& operator=(const TempSibling&) = delete;
    ~TempSibling() {
        if (!path_.empty())
            ::unlink(path_.c_str());
    }
    void Release() { path_.clear(); }

private:
    std::string path_;
};

} // namespace

Result FsyncDirectory(const std::string& dir) {
    Fd dfd;
    auto open_res = Fd::OpenDirectory(dir, dfd);
    if (!open_res.is_ok())
        return open_res;
    return dfd.Fsync();
}

Result WriteFileAtomically(const std::string& path, std::string_view contents) {
    const fs::path target(path);
    fs::path parent = target.parent_path();
    if (parent.empty())
        parent = ".";

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return Result::Fail(ErrorCode::StateIoError,
                            "create_directories failed: " + parent.string() + ": " + ec.message());
    }

    std::string tmpl = (parent / ("." + target.filename().string() + ".tmp-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int raw_fd = ::mkstemp(buf.data());
    if (raw_fd < 0) {
        const int err = errno;
        return Result::Fail(ErrorCode::StateIoError, std::string("mkstemp failed: ") + std::strerror(err));
    }
    Fd fd(raw_fd);
    TempSibling guard(buf.data());

    auto wr = WriteAllToFd(fd.Get(), contents);
    if (!wr.is_ok())
        return wr;

    auto sr = fd.Fsync();
    if (!sr.is_ok())
        return sr;
    fd.Close();

    if (::rename(buf.data(), path.c_str()) != 0) {
        const int err = errno;
        return Result::Fail(ErrorCode::StateIoError,
                            "rename " + std::string(buf.data()) + " -> " + path + ": " + std::strerror(err));
    }
    guard.Release();

    // The new contents are in place; a failed directory sync only weakens
    // durability across a power loss.
    auto dr = FsyncDirectory(parent.string());
    if (!dr.is_ok())
        LogWarn("Replaced %s without syncing its directory: %s", path.c_str(), dr.message().c_str());
    return Result::Ok();
}

Result ReadFileToString(const std::string& path, std::string& out) {
    Fd fd;
    auto open_res = Fd::OpenRead(path, fd);
    if (!open_res.is_ok())
        return open_res;

    out.clear();
    std::vector<char> buf(64 * 1024);
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            return Result::Fail(ErrorCode::StateIoError, "read " + path + ": " + std::strerror(err));
        }
        out.append(buf.data(), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace hotupdate
