#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace metascrub {

    std::vector<std::uint8_t> read_file(const fs::path& path) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            throw IoError("Cannot open input file", path);
        }
        const std::streamsize size = file.tellg();
        if (size < 0) {
            throw IoError("Cannot determine file size", path);
        }
        file.seekg(0, std::ios::beg);
        std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
        if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
            throw IoError("Failed to read input file", path);
        }
        return data;
    }

    void write_file_atomic(const fs::path& target, const std::span<const std::uint8_t> data) {
        std::error_code ec;
        const fs::path parent = target.has_parent_path() ? target.parent_path() : fs::path(".");
        fs::create_directories(parent, ec);
        if (ec) {
            throw IoError("Failed to create output directory (" + ec.message() + ")", parent);
        }

        const fs::path tmp = parent / ("." + target.filename().string() + "." + RandomUtils::random_suffix() + ".tmp");
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw IoError("Cannot open temporary file", tmp);
            }
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            out.close();
            if (!out) {
                fs::remove(tmp, ec);
                throw IoError("Failed to write temporary file", tmp);
            }
        }

        fs::rename(tmp, target, ec);
        if (ec) {
            const std::string rename_error = ec.message();
            std::error_code remove_ec;
            fs::remove(tmp, remove_ec);
            throw IoError("Rename failed (" + rename_error + ")", target);
        }
        Logger::log(LogLevel::Debug, "Wrote " + std::to_string(data.size()) + " bytes to " + target.string(), "file_utils");
    }

    fs::path create_backup(const fs::path& path) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return {};
        }
        fs::path backup = path;
        backup += ".bak";
        fs::copy_file(path, backup, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw IoError("Backup failed (" + ec.message() + ")", backup);
        }
        Logger::log(LogLevel::Debug, "Backup created: " + backup.string(), "file_utils");
        return backup;
    }

    fs::path resolve_output(const fs::path& file, const fs::path& input_base, const fs::path& output_base) {
        if (output_base.empty()) {
            return file;
        }
        std::error_code ec;
        if (!fs::is_directory(input_base, ec)) {
            if (output_base.has_extension()) {
                return output_base;
            }
            return output_base / file.filename();
        }
        const fs::path relative = file.lexically_relative(input_base);
        if (relative.empty() || *relative.begin() == "..") {
            return output_base / file.filename();
        }
        return output_base / relative;
    }

    fs::path resolve_converted_output(const fs::path& file, const fs::path& input_base,
                                      const fs::path& output_base, const std::string_view new_extension) {
        fs::path out = resolve_output(file, input_base, output_base);
        std::error_code ec;
        const bool explicit_file = !output_base.empty() && !fs::is_directory(input_base, ec) &&
                                   output_base.has_extension();
        if (!explicit_file) {
            out.replace_extension(new_extension);
        }
        return out;
    }

} // namespace metascrub
