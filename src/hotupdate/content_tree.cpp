#include "hotupdate/content_tree.hpp"

#include "hotupdate/content_roots.hpp"
#include "io/atomic_file.hpp"
#include "io/tree_ops.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace hotupdate {

namespace {

std::string MarkerPath(const std::string& root) {
    return (fs::path(root) / ContentRootResolver::kMarkerName).string();
}

} // namespace

std::string FindContentFolder(const std::string& root, const std::string& folder_name) {
    const fs::path direct = fs::path(root) / folder_name;
    if (IsDirectory(direct.string()))
        return direct.string();

    // Sorted so the result does not depend on directory order.
    std::vector<fs::path> children;
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_directory(sec) && !it->is_symlink(sec))
            children.push_back(it->path());
    }
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        const fs::path nested = child / folder_name;
        if (IsDirectory(nested.string()))
            return nested.string();
    }
    return {};
}

Result VerifyContentRoot(const std::string& dir, const std::string& entry_file) {
    if (!IsDirectory(dir))
        return Result::Fail(ErrorCode::ExtractionFailed, "content directory missing: " + dir);
    if (!DirectoryHasEntries(dir))
        return Result::Fail(ErrorCode::ExtractionFailed, "content directory is empty: " + dir);
    const std::string entry = (fs::path(dir) / entry_file).string();
    if (!IsRegularFile(entry))
        return Result::Fail(ErrorCode::ExtractionFailed, "entry file missing: " + entry);
    return Result::Ok();
}

Result WriteVersionMarker(const std::string& root, const std::string& version) {
    return WriteFileAtomically(MarkerPath(root), version + "\n");
}

std::optional<std::string> ReadVersionMarker(const std::string& root) {
    std::string text;
    if (!ReadFileToString(MarkerPath(root), text).is_ok())
        return std::nullopt;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
        text.pop_back();
    if (text.empty())
        return std::nullopt;
    return text;
}

} // namespace hotupdate
