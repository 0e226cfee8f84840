#include "hotupdate/directory_transaction.hpp"

#include "io/atomic_file.hpp"
#include "io/tree_ops.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;

namespace hotupdate {

namespace {

class PosixDirectoryOps final : public IDirectoryOps {
public:
    Result Rename(const std::string& from, const std::string& to) const override {
        if (::rename(from.c_str(), to.c_str()) != 0) {
            const int err = errno;
            return Result::Fail(ErrorCode::InstallFailed,
                                "rename " + from + " -> " + to + ": " + std::strerror(err));
        }
        return Result::Ok();
    }

    Result MakeTempDir(const std::string& prefix, std::string& out_dir) const override {
        std::string tmpl = prefix + "XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* created = ::mkdtemp(buf.data());
        if (!created) {
            const int err = errno;
            return Result::Fail(ErrorCode::TempDirError,
                                "mkdtemp " + tmpl + ": " + std::strerror(err));
        }
        out_dir = created;
        return Result::Ok();
    }

    void RemoveTree(const std::string& path) const override {
        std::string err;
        if (!hotupdate::RemoveTree(path, err))
            LogWarn("%s", err.c_str());
    }

    Result SyncDirectory(const std::string& dir) const override {
        return FsyncDirectory(dir);
    }
};

std::string ParentOf(const std::string& path) {
    std::string parent = fs::path(path).parent_path().string();
    return parent.empty() ? std::string(".") : parent;
}

} // namespace

std::shared_ptr<const IDirectoryOps> DefaultDirectoryOps() {
    static const std::shared_ptr<const IDirectoryOps> kDefault =
        std::make_shared<PosixDirectoryOps>();
    return kDefault;
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept
    : ops_(std::move(other.ops_)), path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this == &other)
        return *this;
    Cleanup();
    ops_ = std::move(other.ops_);
    path_ = std::move(other.path_);
    other.path_.clear();
    return *this;
}

ScopedTempDir::~ScopedTempDir() {
    Cleanup();
}

Result ScopedTempDir::Create(const std::string& prefix, ScopedTempDir& out,
                             std::shared_ptr<const IDirectoryOps> ops) {
    ScopedTempDir tmp;
    tmp.ops_ = ops ? std::move(ops) : DefaultDirectoryOps();

    std::error_code ec;
    const std::string parent = ParentOf(prefix);
    fs::create_directories(parent, ec);
    if (ec) {
        return Result::Fail(ErrorCode::TempDirError, "create " + parent + ": " + ec.message());
    }

    auto r = tmp.ops_->MakeTempDir(prefix, tmp.path_);
    if (!r.is_ok())
        return Result::Fail(ErrorCode::TempDirError, r.message());

    out = std::move(tmp);
    return Result::Ok();
}

std::string ScopedTempDir::Release() {
    std::string p = std::move(path_);
    path_.clear();
    return p;
}

void ScopedTempDir::Cleanup() {
    if (path_.empty())
        return;
    if (ops_)
        ops_->RemoveTree(path_);
    path_.clear();
}

DirectoryTransaction::DirectoryTransaction(std::string tomb_prefix,
                                           std::shared_ptr<const IDirectoryOps> ops)
    : tomb_prefix_(std::move(tomb_prefix)), ops_(ops ? std::move(ops) : DefaultDirectoryOps()) {}

DirectoryTransaction::~DirectoryTransaction() {
    if (!committed_)
        Rollback();
}

Result DirectoryTransaction::Move(const std::string& from, const std::string& to) {
    if (committed_)
        return Result::Fail(ErrorCode::InstallFailed, "transaction already committed");
    if (PathExists(to))
        return Result::Fail(ErrorCode::InstallFailed, "rename target exists: " + to);

    auto r = ops_->Rename(from, to);
    if (!r.is_ok())
        return Result::Fail(ErrorCode::InstallFailed, r.message());

    journal_.push_back({from, to});
    LogDebug("Renamed %s -> %s", from.c_str(), to.c_str());
    return Result::Ok();
}

Result DirectoryTransaction::Discard(const std::string& path) {
    if (committed_)
        return Result::Fail(ErrorCode::InstallFailed, "transaction already committed");
    if (!PathExists(path))
        return Result::Ok();

    std::string tomb;
    auto mk = ops_->MakeTempDir(tomb_prefix_, tomb);
    if (!mk.is_ok())
        return Result::Fail(ErrorCode::InstallFailed, mk.message());

    // rename(2) replaces the empty tomb directory atomically.
    auto r = ops_->Rename(path, tomb);
    if (!r.is_ok()) {
        ops_->RemoveTree(tomb);
        return Result::Fail(ErrorCode::InstallFailed, r.message());
    }

    journal_.push_back({path, tomb});
    tombs_.push_back(tomb);
    LogDebug("Parked %s in %s", path.c_str(), tomb.c_str());
    return Result::Ok();
}

Result DirectoryTransaction::Commit() {
    if (committed_)
        return Result::Ok();

    std::set<std::string> dirs;
    for (const auto& step : journal_) {
        dirs.insert(ParentOf(step.from));
        dirs.insert(ParentOf(step.to));
    }
    for (const auto& dir : dirs) {
        auto r = ops_->SyncDirectory(dir);
        if (!r.is_ok())
            LogWarn("fsync %s: %s", dir.c_str(), r.message().c_str());
    }

    committed_ = true;
    for (const auto& tomb : tombs_) {
        ops_->RemoveTree(tomb);
    }
    tombs_.clear();
    journal_.clear();
    return Result::Ok();
}

void DirectoryTransaction::Rollback() {
    if (committed_)
        return;
    for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
        auto r = ops_->Rename(it->to, it->from);
        if (!r.is_ok()) {
            LogError("Undo failed: %s", r.message().c_str());
        } else {
            LogDebug("Undid %s -> %s", it->from.c_str(), it->to.c_str());
        }
    }
    journal_.clear();
    for (const auto& tomb : tombs_) {
        // Undone tombs are gone already; anything left is a failed undo.
        if (PathExists(tomb) && !DirectoryHasEntries(tomb))
            ops_->RemoveTree(tomb);
    }
    tombs_.clear();
}

} // namespace hotupdate
