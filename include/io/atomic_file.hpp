#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace hotupdate {

// Replaces `path` with `contents` so that a reader (or a crash) observes
// either the old file or the complete new one: write to a mkstemp sibling,
// fsync, rename over the target, fsync the parent directory. Once the rename
// succeeded the call succeeds; a failed directory sync is only logged.
Result WriteFileAtomically(const std::string& path, std::string_view contents);

Result ReadFileToString(const std::string& path, std::string& out);

Result FsyncDirectory(const std::string& dir);

} // namespace hotupdate
