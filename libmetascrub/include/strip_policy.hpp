/**
 * @file strip_policy.hpp
 * @brief Defines the policy that governs which records survive stripping.
 */

#ifndef METASCRUB_STRIP_POLICY_HPP
#define METASCRUB_STRIP_POLICY_HPP

#include <optional>
#include <string>
#include <string_view>

namespace metascrub {

/**
 * @brief Strip policy applied by every container engine.
 *
 * The policy is always passed explicitly into an engine call; no engine
 * keeps it as state.
 */
enum class StripPolicy {
    All,  ///< Keep only what the file needs to decode
    Safe, ///< Also keep non-sensitive descriptive records
    None  ///< Leave the input untouched
};

/**
 * @brief Converts a policy to its lower-case command-line spelling.
 */
inline const char* strip_policy_to_string(const StripPolicy policy) {
    switch (policy) {
        case StripPolicy::All:  return "all";
        case StripPolicy::Safe: return "safe";
        case StripPolicy::None: return "none";
    }
    return "";
}

/**
 * @brief Parses "all", "safe" or "none" (case-insensitive).
 * @return The policy, or std::nullopt if the string is not recognised.
 */
std::optional<StripPolicy> parse_strip_policy(std::string_view str);

} // namespace metascrub

#endif // METASCRUB_STRIP_POLICY_HPP
