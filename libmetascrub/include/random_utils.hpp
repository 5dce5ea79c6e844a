/**
 * @file random_utils.hpp
 * @brief Thread-local random helpers used to name temporary files.
 */

#ifndef METASCRUB_RANDOM_UTILS_HPP
#define METASCRUB_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Thread-local random number utilities.
 *
 * The generator (std::mt19937_64) is thread-local, so concurrent workers
 * picking temporary names never share state.
 */
namespace RandomUtils {

    /// @return A random 64-bit unsigned integer.
    unsigned long long next_u64();

    /// @return A random hexadecimal suffix for temporary file names.
    std::string random_suffix();

} // namespace RandomUtils

#endif // METASCRUB_RANDOM_UTILS_HPP
