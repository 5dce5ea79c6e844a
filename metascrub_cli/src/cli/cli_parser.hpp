#ifndef METASCRUB_CLI_PARSER_HPP
#define METASCRUB_CLI_PARSER_HPP

#include "../../../libmetascrub/include/media_format.hpp"
#include "../../../libmetascrub/include/processing_config.hpp"
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

/**
 * @brief Everything the command line can set.
 */
struct Settings {
    bool recursive = false;
    bool verbose = false;
    bool quiet = false;

    unsigned num_threads = 1;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path report_path;

    std::vector<std::filesystem::path> inputs;

    /// Target of the convert subcommand.
    metascrub::MediaFormat convert_to = metascrub::MediaFormat::Unknown;

    metascrub::ProcessingConfig config;
};

/**
 * @brief The subcommands registered by setup_cli_parser().
 */
struct Commands {
    CLI::App* compress = nullptr;
    CLI::App* inspect = nullptr;
    CLI::App* convert = nullptr;
};

/**
 * @brief Configures the CLI11 parser with the global options and the
 * compress, inspect and convert subcommands.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct the options write into.
 * @return The subcommands, so main can tell which one was parsed.
 */
Commands setup_cli_parser(CLI::App& app, Settings& settings);

#endif // METASCRUB_CLI_PARSER_HPP
