#include "io/tree_ops.hpp"

#include "util/logger.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace hotupdate {

bool PathExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool IsDirectory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(fs::status(path, ec));
}

bool IsRegularFile(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(fs::status(path, ec));
}

bool DirectoryHasEntries(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(fs::status(dir, ec)))
        return false;
    fs::directory_iterator it(dir, ec);
    return !ec && it != fs::directory_iterator();
}

bool RemoveTree(const std::string& path, std::string& err) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        err = "remove " + path + ": " + ec.message();
        return false;
    }
    return true;
}

bool CopyTree(const std::string& from, const std::string& to, std::string& err) {
    std::error_code ec;
    fs::create_directories(to, ec);
    if (ec) {
        err = "create " + to + ": " + ec.message();
        return false;
    }
    fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        err = "copy " + from + " -> " + to + ": " + ec.message();
        return false;
    }
    return true;
}

int RemoveEntriesWithPrefix(const std::string& dir, const std::string& prefix) {
    std::error_code ec;
    std::vector<fs::path> victims;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string().rfind(prefix, 0) == 0)
            victims.push_back(it->path());
    }

    int removed = 0;
    for (const auto& p : victims) {
        std::string err;
        if (RemoveTree(p.string(), err)) {
            ++removed;
        } else {
            LogWarn("Cannot remove stale %s: %s", p.c_str(), err.c_str());
        }
    }
    return removed;
}

} // namespace hotupdate
