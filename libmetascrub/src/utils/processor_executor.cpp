#include "../../include/processor_executor.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <chrono>
#include <string>

namespace fs = std::filesystem;

namespace metascrub {

ProcessorExecutor::ProcessorExecutor(const ProcessorRegistry& registry,
                                     ProcessingConfig config,
                                     fs::path output_base,
                                     EventBus& bus,
                                     const unsigned threads)
    : registry_(registry),
      config_(config),
      output_base_(std::move(output_base)),
      event_bus_(bus),
      pool_(threads) {}

void ProcessorExecutor::process(const std::vector<InputFile>& inputs) {
    for (const auto& input : inputs) {
        if (stop_flag_.load(std::memory_order_relaxed)) break;
        try {
            pool_.enqueue([this, input](const std::stop_token& st) {
                if (conversion_target_) {
                    convert_file(input, st);
                } else {
                    process_file(input, st);
                }
            });
        } catch (const std::runtime_error& e) {
            // the pool refuses work once request_stop() has run
            Logger::log(LogLevel::Debug, std::string("Stopped queueing: ") + e.what(), "Executor");
            break;
        }
    }
    pool_.wait_idle();
}

void ProcessorExecutor::request_stop() {
    stop_flag_.store(true, std::memory_order_relaxed);
    pool_.request_stop();
}

void ProcessorExecutor::process_file(const InputFile& input, const std::stop_token& st) {
    const fs::path& file = input.path;
    if (st.stop_requested()) {
        // already dequeued: it still gets its Start/Skipped pair
        event_bus_.publish(FileProcessStartEvent{file, ""});
        event_bus_.publish(FileProcessSkippedEvent{file, "Interrupted"});
        return;
    }

    std::string mime;
    const IProcessor* processor = registry_.find_for(file, &mime);
    event_bus_.publish(FileProcessStartEvent{file, mime});
    if (!processor) {
        Logger::log(LogLevel::Warning, "no processor for " + file.string(), "Executor");
        event_bus_.publish(FileProcessSkippedEvent{file, "Unsupported format"});
        return;
    }

    try {
        const auto start = std::chrono::steady_clock::now();
        const std::vector<std::uint8_t> data = read_file(file);
        const std::vector<std::uint8_t> result = processor->process(data, config_);
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (st.stop_requested()) {
            event_bus_.publish(FileProcessSkippedEvent{file, "Interrupted"});
            return;
        }
        if (result.size() >= data.size()) {
            Logger::log(LogLevel::Debug,
                        "Skipping " + file.string() + ": result (" + std::to_string(result.size()) +
                        ") >= original (" + std::to_string(data.size()) + ")",
                        "Executor");
            event_bus_.publish(FileProcessSkippedEvent{file, "No size improvement"});
            return;
        }

        const fs::path output = resolve_output(file, input.base, output_base_);
        bool replaced = false;
        if (config_.dry_run) {
            Logger::log(LogLevel::Info, "[DRY-RUN] Would write: " + output.string(), "Executor");
        } else {
            if (config_.backup) {
                create_backup(output);
            }
            write_file_atomic(output, result);
            replaced = true;
        }

        Logger::log(LogLevel::Info,
                    file.string() + ": " + std::to_string(data.size()) + " -> " + std::to_string(result.size()) +
                    " bytes",
                    processor->get_name());
        event_bus_.publish(FileProcessCompleteEvent{file, output, data.size(), result.size(), replaced, duration});
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "error on " + file.string() + ": " + std::string(e.what()), "Executor");
        event_bus_.publish(FileProcessErrorEvent{file, e.what()});
    }
}

void ProcessorExecutor::convert_file(const InputFile& input, const std::stop_token& st) {
    const fs::path& file = input.path;
    if (st.stop_requested()) {
        event_bus_.publish(FileProcessStartEvent{file, ""});
        event_bus_.publish(FileProcessSkippedEvent{file, "Interrupted"});
        return;
    }

    std::vector<std::uint8_t> data;
    try {
        data = read_file(file);
    } catch (const std::exception& e) {
        event_bus_.publish(FileProcessStartEvent{file, ""});
        Logger::log(LogLevel::Error, "error on " + file.string() + ": " + std::string(e.what()), "Executor");
        event_bus_.publish(FileProcessErrorEvent{file, e.what()});
        return;
    }

    std::string mime;
    const IProcessor* source = registry_.find_for_data(data, file.extension().string(), &mime);
    event_bus_.publish(FileProcessStartEvent{file, mime});
    const IProcessor* target = registry_.find_by_format(*conversion_target_);
    if (!source || !target || !source->can_convert() || !target->can_convert()) {
        Logger::log(LogLevel::Warning, "cannot convert " + file.string() + " to " +
                    media_format_to_string(*conversion_target_), "Executor");
        event_bus_.publish(FileProcessSkippedEvent{file, "Unsupported format"});
        return;
    }
    if (source == target) {
        event_bus_.publish(FileProcessSkippedEvent{file, "Already " + media_format_to_string(*conversion_target_)});
        return;
    }

    try {
        const auto start = std::chrono::steady_clock::now();
        const std::vector<std::uint8_t> result = target->encode_image(source->decode_image(data), config_);
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (st.stop_requested()) {
            event_bus_.publish(FileProcessSkippedEvent{file, "Interrupted"});
            return;
        }

        const fs::path output = resolve_converted_output(file, input.base, output_base_,
                                                         "." + media_format_to_string(*conversion_target_));
        bool replaced = false;
        if (config_.dry_run) {
            Logger::log(LogLevel::Info, "[DRY-RUN] Would write: " + output.string(), "Executor");
        } else {
            if (config_.backup) {
                create_backup(output);
            }
            write_file_atomic(output, result);
            replaced = true;
        }

        Logger::log(LogLevel::Info,
                    file.string() + " -> " + output.string() + ": " + std::to_string(data.size()) + " -> " +
                    std::to_string(result.size()) + " bytes",
                    target->get_name());
        event_bus_.publish(FileProcessCompleteEvent{file, output, data.size(), result.size(), replaced, duration});
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "error on " + file.string() + ": " + std::string(e.what()), "Executor");
        event_bus_.publish(FileProcessErrorEvent{file, e.what()});
    }
}

} // namespace metascrub
