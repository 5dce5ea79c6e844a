/**
 * @file errors.hpp
 * @brief Exception types thrown by the engines and the processing layer.
 */

#ifndef METASCRUB_ERRORS_HPP
#define METASCRUB_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

namespace metascrub {

/**
 * @brief The input does not match the container grammar.
 *
 * Thrown for a bad signature, a length field that runs past the end of
 * the buffer, or an MP3 without any audio between its tags.
 */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A codec or tag collaborator failed to produce output.
 */
class EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief No registered processor handles the file.
 */
class UnsupportedFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Reading, writing or backing up a file failed.
 */
class IoError : public std::runtime_error {
public:
    IoError(const std::string& what, std::filesystem::path path)
        : std::runtime_error(what + ": " + path.string()), path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace metascrub

#endif // METASCRUB_ERRORS_HPP
