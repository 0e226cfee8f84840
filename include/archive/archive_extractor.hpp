#pragma once

#include "hotupdate/collaborators.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace hotupdate {

// Extracts zip, tar and compressed tar packages with libarchive. Entries
// escaping the destination (absolute paths, "..", unsafe links) fail the
// whole extraction.
class LibArchiveExtractor final : public IExtractor {
public:
    struct Options {
        // 0 disables the limit.
        std::uint64_t max_total_bytes = 0;
    };

    LibArchiveExtractor() = default;
    explicit LibArchiveExtractor(const Options& opt) : opt_(opt) {}

    Result Extract(const std::string& archive_path, const std::string& dest_dir) override;

private:
    Options opt_{};
};

} // namespace hotupdate
