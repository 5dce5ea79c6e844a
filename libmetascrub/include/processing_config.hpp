/**
 * @file processing_config.hpp
 * @brief Options that travel with every processor call.
 */

#ifndef METASCRUB_PROCESSING_CONFIG_HPP
#define METASCRUB_PROCESSING_CONFIG_HPP

#include "strip_policy.hpp"

namespace metascrub {

/**
 * @brief Per-run processing options.
 *
 * Built once by the CLI and passed by const reference into each
 * IProcessor::process call; processors never keep a copy.
 */
struct ProcessingConfig {
    StripPolicy strip = StripPolicy::All; ///< Which records survive
    int quality = 80;                     ///< 0-100, lossy WebP re-encode quality
    int speed = 3;                        ///< 1-10, higher is faster and compresses less
    bool no_lossy = false;                ///< Never re-encode lossily
    bool dry_run = false;                 ///< Process and report but write nothing
    bool backup = false;                  ///< Keep <name>.<ext>.bak before overwriting
};

/**
 * @brief Maps speed (1 = slowest) onto an encoder effort level.
 * @param speed ProcessingConfig::speed, clamped to [1, 10].
 * @param max_effort Highest effort the encoder accepts (9 for zlib, 6 for WebP).
 */
inline int speed_to_effort(int speed, const int max_effort) {
    if (speed < 1) speed = 1;
    if (speed > 10) speed = 10;
    // speed 1 -> max_effort, speed 10 -> 0
    return max_effort - ((speed - 1) * max_effort + 4) / 9;
}

} // namespace metascrub

#endif // METASCRUB_PROCESSING_CONFIG_HPP
