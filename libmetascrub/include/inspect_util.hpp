/**
 * @file inspect_util.hpp
 * @brief Text helpers shared by the engine inspection dumps.
 */

#ifndef METASCRUB_INSPECT_UTIL_HPP
#define METASCRUB_INSPECT_UTIL_HPP

#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace metascrub {

/// Writes a framed section title.
void write_banner(std::ostream& out, std::string_view title);

/// Writes the closing frame of a dump.
void write_footer(std::ostream& out);

/// Writes a thin separator line.
void write_rule(std::ostream& out);

/**
 * @brief Formats a byte count as "N B", "N.NN KB" or "N.NN MB".
 */
std::string format_size(std::uintmax_t bytes);

/**
 * @brief Renders opaque bytes for display.
 *
 * If more than 60% of the characters are printable the data is shown as
 * quoted text (cut at 500 characters unless it mentions a file path);
 * otherwise a hex preview of the first 16 bytes is returned.
 */
std::string format_unknown_data(std::span<const std::uint8_t> data);

/**
 * @brief Best-effort scan for file-system paths embedded in data.
 *
 * Looks for Windows drive paths, paths under /Users/, /home/, /mnt/ and
 * /Volumes/, and names of editing-project files (.prproj, .aep, .psd, ...).
 *
 * @return Sorted, de-duplicated list of candidate paths.
 */
std::vector<std::string> extract_file_paths(std::span<const std::uint8_t> data);

/**
 * @brief Decodes a fixed-width Latin-1 field and trims trailing NUL and space.
 */
std::string trim_fixed_field(std::span<const std::uint8_t> field);

} // namespace metascrub

#endif // METASCRUB_INSPECT_UTIL_HPP
