#pragma once

#include "util/result.hpp"

#include <string>

namespace hotupdate {

// Rejects entries and link targets that would land outside the
// extraction root.
class ArchivePathPolicy {
public:
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeLinkTarget(const char* raw_path, std::string& out_relative) const;
    // Symlink targets are resolved against the entry's directory and must
    // stay inside the extraction root.
    Result CheckSymlinkTarget(const std::string& entry_relative, const char* target) const;

    static bool IsSafeRelativePath(const std::string& p);
};

} // namespace hotupdate
