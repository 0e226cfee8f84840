#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace hotupdate {

// Filesystem primitives used by the swap machinery; injectable so tests can
// fail a specific step.
class IDirectoryOps {
public:
    virtual ~IDirectoryOps() = default;
    virtual Result Rename(const std::string& from, const std::string& to) const = 0;
    virtual Result MakeTempDir(const std::string& prefix, std::string& out_dir) const = 0;
    virtual void RemoveTree(const std::string& path) const = 0;
    virtual Result SyncDirectory(const std::string& dir) const = 0;
};

std::shared_ptr<const IDirectoryOps> DefaultDirectoryOps();

// Temp-named directory (mkdtemp of `prefix` + "XXXXXX") removed on
// destruction unless Release()d.
class ScopedTempDir {
public:
    ScopedTempDir() = default;
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;
    ~ScopedTempDir();

    static Result Create(const std::string& prefix, ScopedTempDir& out,
                         std::shared_ptr<const IDirectoryOps> ops = nullptr);

    const std::string& Path() const { return path_; }
    // Stops tracking the directory and returns its path.
    std::string Release();

private:
    void Cleanup();

    std::shared_ptr<const IDirectoryOps> ops_;
    std::string path_;
};

// Journal of directory renames. Unless Commit() succeeds, the destructor
// undoes every rename in reverse order. Discarded roots are parked in tombs
// and deleted only on commit.
class DirectoryTransaction {
public:
    explicit DirectoryTransaction(std::string tomb_prefix,
                                  std::shared_ptr<const IDirectoryOps> ops = nullptr);
    DirectoryTransaction(const DirectoryTransaction&) = delete;
    DirectoryTransaction& operator=(const DirectoryTransaction&) = delete;
    ~DirectoryTransaction();

    // rename(2) `from` onto `to`; `to` must not exist.
    Result Move(const std::string& from, const std::string& to);

    // Moves `path` into a fresh tomb; a missing path is a no-op.
    Result Discard(const std::string& path);

    // Makes the renames durable and deletes the tombs. Tomb deletion
    // failures are logged; the renames stay committed.
    Result Commit();

    void Rollback();

    bool Committed() const { return committed_; }
    bool Empty() const { return journal_.empty(); }

private:
    struct Step {
        std::string from;
        std::string to;
    };

    std::string tomb_prefix_;
    std::shared_ptr<const IDirectoryOps> ops_;
    std::vector<Step> journal_;
    std::vector<std::string> tombs_;
    bool committed_ = false;
};

} // namespace hotupdate
