#ifndef METASCRUB_REPORT_GENERATOR_HPP
#define METASCRUB_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Outcome of one file, as collected from the executor events.
 */
struct Result {
    std::filesystem::path path;
    std::string mime;           // detected mime
    uintmax_t size_before{};    // original size in bytes
    uintmax_t size_after{};     // result size in bytes
    bool success{};             // no error
    bool replaced{};            // result was written
    bool skipped{};             // left alone (no improvement, unsupported, interrupted)
    double seconds{};           // processing time
    std::string error_msg;      // failure or skip reason
};

void print_console_report(const std::vector<Result>& results,
                          unsigned num_threads,
                          double total_seconds,
                          bool dry_run);

/**
 * @brief Writes results as CSV.
 * @return False if the file could not be opened.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

/// Quotes a CSV field when it holds a separator, quote or newline.
std::string csv_escape(const std::string& data);

#endif // METASCRUB_REPORT_GENERATOR_HPP
