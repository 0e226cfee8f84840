#pragma once

#include <string>

namespace hotupdate {

enum class VersionOrder : int {
    Less = -1,
    Equal = 0,
    Greater = 1,
};

// Dotted numeric versions. A pre-release or build suffix starting at the
// first '-' or '+' is ignored, missing fields count as 0 and a non-numeric
// field counts as 0, so the order is total and Compare never fails.
class VersionComparator {
public:
    static VersionOrder Compare(const std::string& lhs, const std::string& rhs);

    // lhs > rhs
    static bool IsNewer(const std::string& lhs, const std::string& rhs) {
        return Compare(lhs, rhs) == VersionOrder::Greater;
    }
    static bool Equivalent(const std::string& lhs, const std::string& rhs) {
        return Compare(lhs, rhs) == VersionOrder::Equal;
    }
};

} // namespace hotupdate
