#include "report_generator.hpp"
#include "../utils/color.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {

bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

double reduction_pct(const Result& r) {
    return r.success && !r.skipped && r.size_before
               ? 100.0 * (1.0 - static_cast<double>(r.size_after) / static_cast<double>(r.size_before))
               : 0.0;
}

std::string fixed2(const double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::string outcome_of(const Result& r) {
    if (!r.success) return "FAIL";
    if (r.skipped) return "SKIPPED";
    return r.replaced ? "OK" : "OK (dry-run)";
}

const char* color_of(const std::string& outcome) {
    if (outcome == "FAIL") return RED;
    if (outcome == "SKIPPED") return YELLOW;
    return GREEN;
}

} // namespace

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (const char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

void print_console_report(const std::vector<Result>& results,
                          const unsigned num_threads,
                          const double total_seconds,
                          const bool dry_run) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_mime = 15;
    size_t max_before = 12;
    size_t max_after = 12;
    constexpr size_t max_delta = 10;
    size_t max_time = 9;
    constexpr size_t max_result = 14;
    for (const auto& r : results) {
        max_mime   = std::max(max_mime,   r.mime.size() + 2);
        max_before = std::max(max_before, std::to_string(r.size_before / 1024).size() + 2);
        max_after  = std::max(max_after,  std::to_string(r.size_after / 1024).size() + 2);
        max_time   = std::max(max_time,   fixed2(r.seconds).size() + 2);
    }

    const size_t fixed_cols_width = max_mime + max_before + max_after + max_delta + max_time + max_result + 8;
    const size_t file_col_width = term_width > fixed_cols_width + 10
                                ? term_width - fixed_cols_width
                                : 20;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() < max_len ? s : s.substr(0, max_len - 4) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(static_cast<int>(max_mime))   << "MIME type"
              << std::setw(static_cast<int>(max_before)) << "Before(KB)"
              << std::setw(static_cast<int>(max_after))  << "After(KB)"
              << std::setw(static_cast<int>(max_delta))  << "Delta(%)"
              << std::setw(static_cast<int>(max_time))   << "Time(s)"
              << std::setw(static_cast<int>(max_result)) << "Result"
              << "Error"
              << "\n";

    uintmax_t total_original = 0;
    uintmax_t total_saved = 0;
    size_t failed = 0;
    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    for (const auto& r : sorted) {
        const std::string outcome = outcome_of(r);
        const std::string delta = r.success && !r.skipped ? fixed2(reduction_pct(r)) + "%" : "-";
        total_original += r.size_before;
        if (r.success && !r.skipped && r.size_before > r.size_after)
            total_saved += r.size_before - r.size_after;
        if (!r.success) ++failed;

        std::cerr << std::left << std::setw(static_cast<int>(file_col_width))
                  << truncate(r.path.filename().string(), file_col_width)
                  << std::setw(static_cast<int>(max_mime))   << r.mime
                  << std::setw(static_cast<int>(max_before)) << r.size_before / 1024
                  << std::setw(static_cast<int>(max_after))  << r.size_after / 1024
                  << std::setw(static_cast<int>(max_delta))  << delta
                  << std::setw(static_cast<int>(max_time))   << fixed2(r.seconds);
        if (use_colors) {
            std::cerr << color_of(outcome) << std::setw(static_cast<int>(max_result)) << outcome << RESET;
        } else {
            std::cerr << std::setw(static_cast<int>(max_result)) << outcome;
        }
        std::cerr << r.error_msg << "\n";
    }

    std::cerr << "\n" << (dry_run ? "Potential saved space: " : "Total saved space: ")
              << (total_saved / 1024) << " KB\n";
    if (total_original > 0) {
        const double total_pct = 100.0 * (static_cast<double>(total_saved) / static_cast<double>(total_original));
        std::cerr << "Total reduction: " << fixed2(total_pct) << "%\n";
    }
    if (failed > 0) {
        std::cerr << "Failed: " << failed << " of " << results.size() << " files\n";
    }
    std::cerr << "Total time: " << fixed2(total_seconds) << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,MIME,Before(B),After(B),Delta(%),Time(s),Result,Error\n";

    for (const auto& r : results) {
        out << csv_escape(r.path.string()) << ","
            << csv_escape(r.mime) << ","
            << r.size_before << ","
            << r.size_after << ","
            << fixed2(reduction_pct(r)) << ","
            << fixed2(r.seconds) << ","
            << csv_escape(outcome_of(r)) << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << fixed2(total_seconds) << " seconds\n";
    return static_cast<bool>(out);
}
