#include <algorithm>
#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <thread>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libmetascrub/include/processor_registry.hpp"
#include "../../libmetascrub/include/processor_executor.hpp"
#include "../../libmetascrub/include/event_bus.hpp"
#include "../../libmetascrub/include/events.hpp"
#include "../../libmetascrub/include/file_utils.hpp"
#include "../../libmetascrub/include/logger.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace metascrub;
namespace fs = std::filesystem;

static volatile std::sig_atomic_t g_signal = 0;

// only sets the flag; the watcher thread in run_compress does the rest
extern "C" void signal_handler(const int sig) {
    g_signal = sig;
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

namespace {

void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file.string(), false);
        if (!file_sink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
        } else {
            Logger::add_sink(std::move(file_sink));
        }
    }

    const std::string level_name = settings.verbose ? "DEBUG" : settings.log_level;
    if (const auto level = Logger::string_to_level(level_name)) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = *level;
        Logger::add_sink(std::move(console_sink));
    }
    // "NONE" leaves the console without a sink
}

int run_inspect(const Settings& settings) {
    const auto inputs = collect_input_files(settings.inputs, settings.recursive);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return 1;
    }

    const ProcessorRegistry registry;
    bool failed = false;

    for (const auto& input : inputs) {
        try {
            std::string mime;
            const IProcessor* processor = registry.find_for(input.path, &mime);
            if (!processor) {
                std::cerr << YELLOW << input.path.string() << ": unsupported format"
                          << (mime.empty() ? "" : " (" + mime + ")") << RESET << std::endl;
                failed = true;
                continue;
            }
            const auto data = read_file(input.path);
            std::cout << input.path.string() << "\n";
            processor->inspect(data, std::cout);
            std::cout << std::endl;
        } catch (const std::exception& e) {
            std::cerr << RED << input.path.string() << ": " << e.what() << RESET << std::endl;
            Logger::log(LogLevel::Error, input.path.filename().string() + " " + e.what(), "main");
            failed = true;
        }
    }
    return failed ? 1 : 0;
}

int run_compress(const Settings& settings) {
    const auto inputs = collect_input_files(settings.inputs, settings.recursive);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return 1;
    }

    ProcessorRegistry registry;
    EventBus bus;

    // results collected for reporting; all handlers run under the bus lock
    std::vector<Result> results;
    std::map<fs::path, std::string> mimes;
    bool any_error = false;

    const size_t total = inputs.size();
    size_t done = 0;
    const auto start_total = std::chrono::steady_clock::now();

    auto on_finish = [&] {
        ++done;
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_total).count();
        if (!settings.quiet) {
            print_progress_bar(done, total, elapsed);
        }
    };

    bus.subscribe<FileProcessStartEvent>([&](const FileProcessStartEvent& e) {
        mimes[e.path] = e.mime;
    });

    bus.subscribe<FileProcessCompleteEvent>([&](const FileProcessCompleteEvent& e) {
        Result r;
        r.path = e.path;
        r.mime = mimes[e.path];
        r.size_before = e.original_size;
        r.size_after = e.new_size;
        r.success = true;
        r.replaced = e.replaced;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        results.push_back(std::move(r));
        on_finish();
    });

    bus.subscribe<FileProcessErrorEvent>([&](const FileProcessErrorEvent& e) {
        Logger::log(LogLevel::Error, e.path.filename().string() + " " + e.error_message, "main");
        any_error = true;

        Result r;
        r.path = e.path;
        r.mime = mimes[e.path];
        std::error_code ec;
        const auto size = fs::file_size(e.path, ec);
        r.size_before = ec ? 0 : size;
        r.size_after = r.size_before;
        r.success = false;
        r.error_msg = e.error_message;
        results.push_back(std::move(r));
        on_finish();
    });

    bus.subscribe<FileProcessSkippedEvent>([&](const FileProcessSkippedEvent& e) {
        Logger::log(LogLevel::Info, e.path.filename().string() + " skipped: " + e.reason, "main");

        Result r;
        r.path = e.path;
        r.mime = mimes[e.path];
        std::error_code ec;
        const auto size = fs::file_size(e.path, ec);
        r.size_before = ec ? 0 : size;
        r.size_after = r.size_before;
        r.success = true;
        r.skipped = true;
        r.error_msg = e.reason;
        results.push_back(std::move(r));
        on_finish();
    });

    ProcessorExecutor executor(registry,
                               settings.config,
                               settings.output_path,
                               bus,
                               settings.num_threads);
    if (settings.convert_to != MediaFormat::Unknown) {
        executor.set_conversion_target(settings.convert_to);
    }

    std::atomic<bool> interrupted{false};
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::jthread watcher([&](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (g_signal != 0) {
                std::cerr << CYAN
                          << "\n[INTERRUPT] Stop detected. Waiting for threads to finish..."
                          << RESET << std::endl;
                executor.request_stop();
                interrupted.store(true);
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    executor.process(inputs);
    watcher.request_stop();
    watcher.join();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        std::cerr << std::endl;
        print_console_report(results, settings.num_threads, total_seconds, settings.config.dry_run);
    }

    if (!settings.report_path.empty()) {
        if (!export_csv_report(results, settings.report_path, total_seconds)) {
            Logger::log(LogLevel::Error, "Cannot write report: " + settings.report_path.string(), "main");
            any_error = true;
        }
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    return any_error ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"metascrub: strip privacy-sensitive metadata from PNG, WebP, WAV and MP3 files."};
    Settings settings;
    const Commands commands = setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    setup_logging(settings);
    init_utf8_locale();

    try {
        if (commands.inspect->parsed()) {
            return run_inspect(settings);
        }
        // convert shares the compress pipeline; Settings::convert_to tells them apart
        return run_compress(settings);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
}
