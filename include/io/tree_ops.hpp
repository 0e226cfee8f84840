#pragma once

#include <string>

namespace hotupdate {

bool PathExists(const std::string& path);
bool IsDirectory(const std::string& path);
bool IsRegularFile(const std::string& path);

// True when `dir` is a directory with at least one entry.
bool DirectoryHasEntries(const std::string& dir);

// Recursive delete; a missing path is not an error.
bool RemoveTree(const std::string& path, std::string& err);

// Copies the contents of `from` into the (possibly new) directory `to`.
// Symlinks are copied as links.
bool CopyTree(const std::string& from, const std::string& to, std::string& err);

// Removes every entry of `dir` whose name starts with `prefix`; returns how
// many were removed.
int RemoveEntriesWithPrefix(const std::string& dir, const std::string& prefix);

} // namespace hotupdate
