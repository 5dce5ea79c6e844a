/**
 * @file file_utils.hpp
 * @brief File reading, atomic writing, backups and output path resolution.
 */

#ifndef METASCRUB_FILE_UTILS_HPP
#define METASCRUB_FILE_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace metascrub {

    /**
     * @brief One file to process together with the command-line argument it came from.
     */
    struct InputFile {
        std::filesystem::path path; ///< The file itself
        std::filesystem::path base; ///< The file or directory named on the command line
    };

    /**
     * @brief Reads a whole file into memory.
     * @throws IoError if the file cannot be opened or read.
     */
    std::vector<std::uint8_t> read_file(const std::filesystem::path& path);

    /**
     * @brief Writes data to target through a temporary sibling and a rename.
     *
     * Parent directories are created as needed. On failure the temporary
     * file is removed and target is left as it was.
     *
     * @throws IoError if any step fails.
     */
    void write_file_atomic(const std::filesystem::path& target, std::span<const std::uint8_t> data);

    /**
     * @brief Copies path to "<name>.<ext>.bak" if path exists.
     * @return The backup path, or an empty path if there was nothing to back up.
     * @throws IoError if the copy fails.
     */
    std::filesystem::path create_backup(const std::filesystem::path& path);

    /**
     * @brief Decides where the result for file is written.
     *
     * - output_base empty: file itself (in place).
     * - input_base is a regular file: output_base when it has an
     *   extension, otherwise output_base / file name.
     * - input_base is a directory: output_base / (file relative to input_base).
     */
    std::filesystem::path resolve_output(const std::filesystem::path& file,
                                         const std::filesystem::path& input_base,
                                         const std::filesystem::path& output_base);

    /**
     * @brief Like resolve_output(), but for a file converted to another format.
     *
     * The result carries new_extension (with the dot), except when the
     * caller named an explicit output file. Without an output base the
     * converted file lands next to the source.
     */
    std::filesystem::path resolve_converted_output(const std::filesystem::path& file,
                                                   const std::filesystem::path& input_base,
                                                   const std::filesystem::path& output_base,
                                                   std::string_view new_extension);

} // namespace metascrub

#endif // METASCRUB_FILE_UTILS_HPP
