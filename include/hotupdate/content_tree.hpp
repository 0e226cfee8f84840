#pragma once

#include "util/result.hpp"

#include <optional>
#include <string>

namespace hotupdate {

// Locates the content folder named `folder_name` in an extracted package:
// either `root/<folder_name>` or `root/<any>/<folder_name>`. Empty when
// absent.
std::string FindContentFolder(const std::string& root, const std::string& folder_name = "www");

// A root is loadable when it is a non-empty directory holding `entry_file`.
Result VerifyContentRoot(const std::string& dir, const std::string& entry_file);

Result WriteVersionMarker(const std::string& root, const std::string& version);
std::optional<std::string> ReadVersionMarker(const std::string& root);

} // namespace hotupdate
