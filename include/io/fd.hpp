#pragma once

#include "util/result.hpp"

#include <string>

namespace hotupdate {

// Owning file descriptor.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    static Result OpenRead(const std::string& path, Fd& out);
    static Result OpenDirectory(const std::string& path, Fd& out);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    void Close();

    Result Fsync() const;

private:
    int fd_{-1};
};

} // namespace hotupdate
