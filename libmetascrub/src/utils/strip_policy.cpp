#include "../../include/strip_policy.hpp"
#include <algorithm>
#include <cctype>

namespace metascrub {

std::optional<StripPolicy> parse_strip_policy(const std::string_view str) {
    std::string lower(str);
    std::ranges::transform(lower, lower.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "all") return StripPolicy::All;
    if (lower == "safe") return StripPolicy::Safe;
    if (lower == "none") return StripPolicy::None;
    return std::nullopt;
}

} // namespace metascrub
