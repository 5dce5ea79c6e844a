#include "file_scanner.hpp"
#include "../../../libmetascrub/include/logger.hpp"
#include "../../../libmetascrub/include/media_format.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::ranges::transform(name, name.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini";
}

namespace {

bool is_supported(const fs::path& p) {
    return metascrub::parse_media_format(p.extension().string()).has_value();
}

template <typename Iterator>
void collect_from(Iterator it, const fs::path& base, std::vector<metascrub::InputFile>& result) {
    std::error_code ec;
    for (; it != Iterator(); it.increment(ec)) {
        if (ec) {
            Logger::log(LogLevel::Warning, "Cannot read directory entry under " + base.string() + ": " + ec.message(), "scanner");
            break;
        }
        const fs::path& path = it->path();
        if (it->is_regular_file(ec) && !is_junk(path) && is_supported(path)) {
            result.push_back({path, base});
        }
    }
}

} // namespace

std::vector<metascrub::InputFile>
collect_input_files(const std::vector<fs::path>& inputs, const bool recursive) {
    std::vector<metascrub::InputFile> result;

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in, ec)) {
            const size_t before = result.size();
            if (recursive) {
                collect_from(fs::recursive_directory_iterator(in, fs::directory_options::skip_permission_denied, ec), in, result);
            } else {
                collect_from(fs::directory_iterator(in, fs::directory_options::skip_permission_denied, ec), in, result);
            }
            // directory iteration order is unspecified
            std::sort(result.begin() + static_cast<std::ptrdiff_t>(before), result.end(),
                      [](const metascrub::InputFile& a, const metascrub::InputFile& b) { return a.path < b.path; });
        } else if (fs::is_regular_file(in, ec) && !is_junk(in)) {
            result.push_back({in, in});
        }
    }

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
