#include "archive/archive_path_policy.hpp"

#include "util/path_utils.hpp"

#include <string_view>

namespace hotupdate {

bool ArchivePathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string::npos) return false;

    std::string_view sv(p);
    while (!sv.empty()) {
        while (!sv.empty() && sv.front() == '/') sv.remove_prefix(1);
        const auto pos = sv.find('/');
        const auto seg = sv.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos);
    }
    return true;
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) const {
    out_relative = NormalizeArchivePath(raw_path ? std::string(raw_path) : std::string());
    if (out_relative.empty() || out_relative == ".") return Result::Ok();

    if (!IsSafeRelativePath(out_relative)) {
        return Result::Fail(ErrorCode::ExtractionFailed, "Unsafe path in archive: " + out_relative);
    }
    return Result::Ok();
}

Result ArchivePathPolicy::NormalizeLinkTarget(const char* raw_path, std::string& out_relative) const {
    if (!raw_path || !*raw_path) {
        out_relative.clear();
        return Result::Ok();
    }

    out_relative = NormalizeArchivePath(std::string(raw_path));
    if (out_relative.empty() || out_relative == ".") return Result::Ok();

    if (!IsSafeRelativePath(out_relative)) {
        return Result::Fail(ErrorCode::ExtractionFailed, "Unsafe hardlink target in archive: " + out_relative);
    }
    return Result::Ok();
}

Result ArchivePathPolicy::CheckSymlinkTarget(const std::string& entry_relative,
                                             const char* target) const {
    if (!target || !*target) return Result::Ok();

    const std::string t(target);
    if (t.front() == '/') {
        return Result::Fail(ErrorCode::ExtractionFailed,
                            "Absolute symlink in archive: " + entry_relative + " -> " + t);
    }

    // Depth of the directory holding the link.
    int depth = 0;
    for (char c : entry_relative) {
        if (c == '/') ++depth;
    }

    std::string_view sv(t);
    while (!sv.empty()) {
        const auto pos = sv.find('/');
        const auto seg = sv.substr(0, pos);
        if (seg == "..") {
            if (--depth < 0) {
                return Result::Fail(ErrorCode::ExtractionFailed,
                                    "Symlink escapes archive root: " + entry_relative + " -> " + t);
            }
        } else if (!seg.empty() && seg != ".") {
            ++depth;
        }
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos + 1);
    }
    return Result::Ok();
}

} // namespace hotupdate
