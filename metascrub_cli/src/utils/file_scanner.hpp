#ifndef METASCRUB_FILE_SCANNER_HPP
#define METASCRUB_FILE_SCANNER_HPP

#include "../../../libmetascrub/include/file_utils.hpp"
#include <filesystem>
#include <vector>

/**
 * @brief Expands command-line inputs into the files to process.
 *
 * A file named directly is always kept (unless it is OS junk such as
 * .DS_Store); the registry decides later whether it is supported.
 * Directories contribute the files with a supported extension, from
 * their top level only unless recursive is set.
 *
 * @return Files in input order, each tagged with the argument it came from.
 */
std::vector<metascrub::InputFile>
collect_input_files(const std::vector<std::filesystem::path>& inputs, bool recursive);

/// @return True for OS metadata files (.DS_Store, desktop.ini, AppleDouble "._*").
bool is_junk(const std::filesystem::path& p);

#endif // METASCRUB_FILE_SCANNER_HPP
