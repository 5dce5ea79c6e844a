#include "../../include/inspect_util.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace metascrub {

namespace {

constexpr std::size_t kTextPreviewLimit = 500;
constexpr std::size_t kHexPreviewBytes = 16;

constexpr std::array<std::string_view, 7> kProjectExtensions = {
    ".prproj", ".aep", ".fcp", ".fcpx", ".avp", ".psd", ".ai"
};

constexpr std::array<std::string_view, 4> kUnixRoots = {
    "/Users/", "/home/", "/mnt/", "/Volumes/"
};

bool is_printable(const unsigned char c) {
    return (c >= 0x21 && c <= 0x7E) || c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool mentions_path(const std::string_view text) {
    static constexpr std::array<std::string_view, 9> markers = {
        ":\\", ":/", "/Users/", "/home/", "C:\\", "D:\\", ".prproj", ".aep", "\\AppData\\"
    };
    return std::ranges::any_of(markers, [&](const std::string_view m) {
        return text.find(m) != std::string_view::npos;
    });
}

std::string escape_nul(const std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        if (c == '\0') out += "\\0";
        else out += c;
    }
    return out;
}

void scan_windows_paths(const std::string_view line, std::vector<std::string>& paths) {
    constexpr std::string_view stop = std::string_view("\0\n\r<>\"|?*", 9);
    for (std::size_t i = line.find(":\\"); i != std::string_view::npos; i = line.find(":\\", i + 1)) {
        if (i == 0 || !std::isalpha(static_cast<unsigned char>(line[i - 1]))) continue;
        const std::string_view rest = line.substr(i - 1);
        const std::size_t end = std::min(rest.find_first_of(stop), rest.size());
        if (end <= 3) continue;
        const auto path = trim(rest.substr(0, end));
        if (path.size() > 3) paths.emplace_back(path);
    }
}

void scan_unix_paths(const std::string_view line, std::vector<std::string>& paths) {
    const bool has_root = std::ranges::any_of(kUnixRoots, [&](const std::string_view root) {
        return line.find(root) != std::string_view::npos;
    });
    if (!has_root) return;

    constexpr std::string_view stop = std::string_view("\0\n\r<>\" \t", 8);
    for (std::size_t i = line.find('/'); i != std::string_view::npos; i = line.find('/', i + 1)) {
        const std::string_view rest = line.substr(i);
        const std::size_t end = std::min(rest.find_first_of(stop), rest.size());
        const auto path = trim(rest.substr(0, end));
        if (path.size() <= 5) continue;
        if (path.find('.') == std::string_view::npos && !path.ends_with('/')) continue;
        const bool rooted = std::ranges::any_of(kUnixRoots, [&](const std::string_view root) {
            return path.starts_with(root);
        });
        if (rooted) {
            paths.emplace_back(path);
            break;
        }
    }
}

void scan_project_files(const std::string_view line, std::vector<std::string>& paths) {
    constexpr std::string_view delimiters = std::string_view("\">\0\n", 4);
    for (const auto ext : kProjectExtensions) {
        const std::size_t pos = line.find(ext);
        if (pos == std::string_view::npos) continue;
        const std::string_view before = line.substr(0, pos + ext.size());
        const std::size_t delim = before.find_last_of(delimiters);
        const std::size_t start = delim == std::string_view::npos ? 0 : delim + 1;
        const auto path = trim(before.substr(start));
        if (path.size() > ext.size() + 2) paths.emplace_back(path);
    }
}

} // namespace

void write_banner(std::ostream& out, const std::string_view title) {
    out << "\n" << std::string(55, '=') << "\n";
    const std::size_t pad = title.size() < 55 ? (55 - title.size()) / 2 : 0;
    out << std::string(pad, ' ') << title << "\n";
    out << std::string(55, '=') << "\n\n";
}

void write_footer(std::ostream& out) {
    out << "\n" << std::string(55, '=') << "\n\n";
}

void write_rule(std::ostream& out) {
    out << std::string(55, '-') << "\n";
}

std::string format_size(const std::uintmax_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / 1024.0 << " KB";
    } else {
        oss << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    }
    return oss.str();
}

std::string format_unknown_data(const std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return "<empty>";
    }

    const auto printable = static_cast<std::size_t>(std::ranges::count_if(data, [](const std::uint8_t b) {
        return is_printable(b);
    }));

    if (printable * 100 / data.size() > 60) {
        const std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
        const bool has_paths = mentions_path(text);
        std::string shown;
        if (has_paths || text.size() <= kTextPreviewLimit) {
            shown = escape_nul(text);
        } else {
            shown = escape_nul(text.substr(0, kTextPreviewLimit)) + "... (truncated, total " +
                    std::to_string(data.size()) + " bytes)";
        }
        return "\"" + shown + "\"" + (has_paths ? " [!] CONTAINS FILE PATHS" : "");
    }

    std::ostringstream oss;
    oss << "<binary: ";
    const std::size_t n = std::min(data.size(), kHexPreviewBytes);
    for (std::size_t i = 0; i < n; ++i) {
        if (i) oss << ' ';
        oss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    oss << std::dec;
    if (data.size() > kHexPreviewBytes) {
        oss << " ... (" << data.size() << " bytes total)>";
    } else {
        oss << " (" << data.size() << " bytes)>";
    }
    return oss.str();
}

std::vector<std::string> extract_file_paths(const std::span<const std::uint8_t> data) {
    const std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
    std::vector<std::string> paths;

    std::size_t line_start = 0;
    while (line_start <= text.size()) {
        std::size_t line_end = text.find('\n', line_start);
        if (line_end == std::string_view::npos) line_end = text.size();
        std::string_view line = text.substr(line_start, line_end - line_start);
        if (line.ends_with('\r')) line.remove_suffix(1);

        scan_windows_paths(line, paths);
        scan_unix_paths(line, paths);
        scan_project_files(line, paths);

        line_start = line_end + 1;
    }

    std::ranges::sort(paths);
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    return paths;
}

std::string trim_fixed_field(const std::span<const std::uint8_t> field) {
    std::string out;
    for (const std::uint8_t b : field) {
        if (b == 0) break;
        if (b < 0x80) {
            out += static_cast<char>(b);
        } else {
            // Latin-1 to UTF-8
            out += static_cast<char>(0xC0 | (b >> 6));
            out += static_cast<char>(0x80 | (b & 0x3F));
        }
    }
    while (!out.empty() && (out.back() == ' ' || out.back() == '\0')) {
        out.pop_back();
    }
    return out;
}

} // namespace metascrub
