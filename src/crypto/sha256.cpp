#include "crypto/sha256.hpp"

#include "io/fd.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace hotupdate {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

bool InitSha256(EvpCtx& ctx) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1;
}

bool FinalSha256(EvpCtx& ctx, std::array<std::uint8_t, 32>& out) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return false;
    return len == out.size();
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // namespace

struct Sha256Hasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool failed = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    impl_->initialized = InitSha256(impl_->ctx);
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->initialized || impl_->failed || data.empty()) return;
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        impl_->failed = true;
    }
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || !impl_->initialized || impl_->failed) return {};
    impl_->failed = true;  // single use
    std::array<std::uint8_t, 32> digest{};
    if (!FinalSha256(impl_->ctx, digest)) return {};
    return HexEncode(digest);
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    hasher.Update(data);
    return hasher.FinalHex();
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    Fd fd;
    auto open_res = Fd::OpenRead(path, fd);
    if (!open_res.is_ok())
        return Result::Fail(ErrorCode::DownloadFailed, open_res.message());

    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(ErrorCode::DownloadFailed,
                                "read " + path + ": " + std::strerror(err));
        }
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }

    out_hex = hasher.FinalHex();
    if (out_hex.empty())
        return Result::Fail(ErrorCode::DownloadFailed, "sha256 compute failed");
    return Result::Ok();
}

bool DigestEquals(const std::string& lhs_hex, const std::string& rhs_hex) {
    return !lhs_hex.empty() && Lower(lhs_hex) == Lower(rhs_hex);
}

} // namespace hotupdate
