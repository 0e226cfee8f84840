#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace hotupdate {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

Result Fd::OpenRead(const std::string& path, Fd& out) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(ErrorCode::StateIoError,
                            "open " + path + ": " + std::strerror(err));
    }
    out.Reset(fd);
    return Result::Ok();
}

Result Fd::OpenDirectory(const std::string& path, Fd& out) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(ErrorCode::StateIoError,
                            "open directory " + path + ": " + std::strerror(err));
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

void Fd::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

Result Fd::Fsync() const {
    if (fd_ < 0)
        return Result::Fail(ErrorCode::StateIoError, "fsync on closed descriptor");
    if (::fsync(fd_) != 0) {
        const int err = errno;
        return Result::Fail(ErrorCode::StateIoError, std::string("fsync failed: ") + std::strerror(err));
    }
    return Result::Ok();
}

} // namespace hotupdate
