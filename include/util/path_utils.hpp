#pragma once

#include <string>
#include <string_view>

namespace hotupdate {

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// Versions come from the host; keep only characters that are safe in a
// single path component.
inline std::string VersionDirName(std::string_view version) {
    std::string out;
    out.reserve(version.size());
    for (char c : version) {
        const bool safe = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                          (c >= 'A' && c <= 'Z') || c == '.' || c == '-' || c == '_' || c == '+';
        out.push_back(safe ? c : '_');
    }
    if (out.empty() || out == "." || out == "..") {
        out = "v" + out;
    }
    return out;
}

} // namespace hotupdate
