#pragma once

#include "hotupdate/collaborators.hpp"

#include <cstddef>

namespace hotupdate {

// Fetches packages addressed by "file://" URLs or absolute paths. Remote
// schemes belong to the host's transport and are rejected.
class LocalFetcher final : public IFetcher {
public:
    explicit LocalFetcher(std::size_t chunk_bytes = 256 * 1024) : chunk_bytes_(chunk_bytes) {}

    Result Fetch(const std::string& url,
                 const std::string& dest_path,
                 std::string_view version,
                 IProgress* progress,
                 const std::atomic_bool* cancel) override;

    // "file:///a/b" -> "/a/b", "/a/b" -> "/a/b", anything else -> "".
    static std::string LocalPathFromUrl(const std::string& url);

private:
    std::size_t chunk_bytes_;
};

} // namespace hotupdate
