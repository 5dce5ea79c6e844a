#include "cli_parser.hpp"
#include "../../../libmetascrub/include/strip_policy.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <map>
#include <thread>

namespace {

CLI::Option* add_inputs(CLI::App* cmd, Settings& settings) {
    return cmd->add_option("inputs", settings.inputs, "One or more files or directories.")
        ->required()
        ->check(CLI::ExistingPath);
}

} // namespace

Commands setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);

    // --- global options ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write all log messages to FILE.");

    app.add_flag("-v,--verbose", settings.verbose,
                 "Shorthand for --log-level DEBUG.");

    Commands commands;

    // --- compress ---
    CLI::App* compress = app.add_subcommand("compress", "Strip metadata and write smaller files.");
    commands.compress = compress;

    add_inputs(compress, settings);

    compress->add_option("-o,--output", settings.output_path,
                         "Write results to PATH instead of modifying in place.\n"
                         "(A file path for a single file input, otherwise a directory.)");

    compress->add_option("--strip", settings.config.strip, "Metadata to remove: all, safe or none.")
        ->default_val(metascrub::StripPolicy::All)
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, metascrub::StripPolicy>{
                {"all", metascrub::StripPolicy::All},
                {"safe", metascrub::StripPolicy::Safe},
                {"none", metascrub::StripPolicy::None}
            }, CLI::ignore_case));

    compress->add_option("-q,--quality", settings.config.quality,
                         "Lossy re-encode quality (0-100).")
                         ->default_val(settings.config.quality)
                         ->check(CLI::Range(0, 100));

    compress->add_option("-s,--speed", settings.config.speed,
                         "Encoder speed (1 = smallest output, 10 = fastest).")
                         ->default_val(settings.config.speed)
                         ->check(CLI::Range(1, 10));

    compress->add_flag("--no-lossy", settings.config.no_lossy,
                       "Never re-encode lossily.");

    compress->add_flag("-r,--recursive", settings.recursive,
                       "Recursively scan input folders.");

    compress->add_flag("--backup", settings.config.backup,
                       "Keep a .bak copy of every file that gets overwritten.");

    compress->add_flag("--dry-run", settings.config.dry_run,
                       "Process and report without writing anything.");

    compress->add_flag("--quiet", settings.quiet,
                       "Suppress the progress bar and the results table.");

    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    compress->add_option("--threads", settings.num_threads,
                         "Threads to use for parallel processing.")
                         ->default_val(settings.num_threads)
                         ->check(CLI::PositiveNumber);

    compress->add_option("--report", settings.report_path,
                         "CSV report export filename.")
                         ->take_last();

    compress->callback([&settings]() {
        if (!settings.output_path.empty() && settings.inputs.size() > 1 && settings.output_path.has_extension()) {
            throw CLI::ValidationError("--output must be a directory when more than one input is given.");
        }
    });

    // --- inspect ---
    CLI::App* inspect = app.add_subcommand("inspect", "Print the metadata found in each file.");
    commands.inspect = inspect;

    add_inputs(inspect, settings);

    inspect->add_flag("-r,--recursive", settings.recursive,
                      "Recursively scan input folders.");

    // --- convert ---
    CLI::App* convert = app.add_subcommand("convert", "Re-encode images as PNG or WebP, without metadata.");
    commands.convert = convert;

    add_inputs(convert, settings);

    convert->add_option("-t,--to", settings.convert_to, "Target format: png or webp.")
        ->required()
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, metascrub::MediaFormat>{
                {"png", metascrub::MediaFormat::Png},
                {"webp", metascrub::MediaFormat::Webp}
            }, CLI::ignore_case));

    convert->add_option("-o,--output", settings.output_path,
                        "Write results to PATH instead of next to each input.\n"
                        "(A file path for a single file input, otherwise a directory.)");

    convert->add_option("-q,--quality", settings.config.quality,
                        "Lossy encode quality (0-100).")
                        ->default_val(settings.config.quality)
                        ->check(CLI::Range(0, 100));

    convert->add_option("-s,--speed", settings.config.speed,
                        "Encoder speed (1 = smallest output, 10 = fastest).")
                        ->default_val(settings.config.speed)
                        ->check(CLI::Range(1, 10));

    convert->add_flag("--no-lossy", settings.config.no_lossy,
                      "Encode losslessly.");

    convert->add_flag("-r,--recursive", settings.recursive,
                      "Recursively scan input folders.");

    convert->add_flag("--backup", settings.config.backup,
                      "Keep a .bak copy of every file that gets overwritten.");

    convert->add_flag("--dry-run", settings.config.dry_run,
                      "Convert and report without writing anything.");

    convert->add_flag("--quiet", settings.quiet,
                      "Suppress the progress bar and the results table.");

    convert->add_option("--threads", settings.num_threads,
                        "Threads to use for parallel processing.")
                        ->default_val(settings.num_threads)
                        ->check(CLI::PositiveNumber);

    convert->add_option("--report", settings.report_path,
                        "CSV report export filename.")
                        ->take_last();

    convert->callback([&settings]() {
        if (!settings.output_path.empty() && settings.inputs.size() > 1 && settings.output_path.has_extension()) {
            throw CLI::ValidationError("--output must be a directory when more than one input is given.");
        }
    });

    return commands;
}
