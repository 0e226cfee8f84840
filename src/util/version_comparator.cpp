#include "util/version_comparator.hpp"

#include <charconv>
#include <cstdint>
#include <ranges>
#include <string_view>

namespace hotupdate {

namespace {

std::string_view StripSuffix(std::string_view v) {
    const auto pos = v.find_first_of("-+");
    return pos == std::string_view::npos ? v : v.substr(0, pos);
}

std::uint64_t ParseField(std::string_view sv) {
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{})
        return 0;
    (void)ptr;
    return value;
}

} // namespace

VersionOrder VersionComparator::Compare(const std::string& lhs, const std::string& rhs) {
    if (lhs == rhs)
        return VersionOrder::Equal;

    auto lhs_parts = StripSuffix(lhs) | std::views::split('.') |
                     std::views::transform([](auto&& rng) { return std::string_view(rng); });
    auto rhs_parts = StripSuffix(rhs) | std::views::split('.') |
                     std::views::transform([](auto&& rng) { return std::string_view(rng); });

    auto it_lhs = lhs_parts.begin();
    auto it_rhs = rhs_parts.begin();

    while (it_lhs != lhs_parts.end() || it_rhs != rhs_parts.end()) {
        std::uint64_t lhs_val = 0;
        std::uint64_t rhs_val = 0;

        if (it_lhs != lhs_parts.end()) {
            lhs_val = ParseField(*it_lhs);
            ++it_lhs;
        }

        if (it_rhs != rhs_parts.end()) {
            rhs_val = ParseField(*it_rhs);
            ++it_rhs;
        }

        if (lhs_val > rhs_val)
            return VersionOrder::Greater;
        if (lhs_val < rhs_val)
            return VersionOrder::Less;
    }

    return VersionOrder::Equal;
}

} // namespace hotupdate
