/**
 * @file temp_dir.hpp
 * @brief Scratch directory removed when the fixture goes out of scope.
 */

#ifndef METASCRUB_TEMP_DIR_HPP
#define METASCRUB_TEMP_DIR_HPP

#include "../libmetascrub/include/random_utils.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <system_error>

namespace metascrub::test {

class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() / ("metascrub_test_" + RandomUtils::random_suffix())) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    /// Writes bytes to path() / relative, creating parent directories.
    std::filesystem::path write(const std::filesystem::path& relative, const std::span<const std::uint8_t> bytes) const {
        const auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return target;
    }

private:
    std::filesystem::path path_;
};

} // namespace metascrub::test

#endif // METASCRUB_TEMP_DIR_HPP
