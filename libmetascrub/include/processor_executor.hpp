/**
 * @file processor_executor.hpp
 * @brief Runs the processors over a set of files on a worker pool.
 */

#ifndef METASCRUB_PROCESSOR_EXECUTOR_HPP
#define METASCRUB_PROCESSOR_EXECUTOR_HPP

#include "event_bus.hpp"
#include "file_utils.hpp"
#include "processing_config.hpp"
#include "processor_registry.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace metascrub {

/**
 * @brief Orchestrates read, process and write for every input file.
 *
 * @details One ThreadPool task per file. Each task reads the file, runs
 * the matching processor, drops the result if it is not smaller than the
 * input, and otherwise writes it to the resolved output path (backup first
 * when requested). Progress and outcomes are published on the EventBus:
 * every file that leaves the queue gets a FileProcessStartEvent followed
 * by exactly one of Complete, Skipped or Error. Files still queued when
 * request_stop() runs are discarded and publish nothing.
 */
class ProcessorExecutor {
public:
    /**
     * @param registry Processor lookup.
     * @param config Options passed to every processor call.
     * @param output_base Output file or directory; empty for in-place.
     * @param bus EventBus used to publish progress and results.
     * @param threads Number of worker threads.
     */
    explicit ProcessorExecutor(const ProcessorRegistry& registry,
                               ProcessingConfig config,
                               std::filesystem::path output_base,
                               EventBus& bus,
                               unsigned threads = std::thread::hardware_concurrency() / 2);

    /**
     * @brief Switches the executor from stripping to format conversion.
     *
     * Each input is decoded by its own processor and re-encoded by the one
     * for @p target. The output takes the target's extension and is written
     * even when it is larger than the input. Inputs whose processor cannot
     * convert are skipped.
     */
    void set_conversion_target(MediaFormat target) {
        conversion_target_ = target;
    }

    /**
     * @brief Processes all inputs and returns when every task is done.
     */
    void process(const std::vector<InputFile>& inputs);

    /// @return true once request_stop() has been called.
    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Discards queued files and signals running tasks to stop.
     *
     * Safe to call from another thread while process() is running.
     */
    void request_stop();

private:
    /// Body of one pool task.
    void process_file(const InputFile& input, const std::stop_token& st);
    void convert_file(const InputFile& input, const std::stop_token& st);

    const ProcessorRegistry& registry_;
    ProcessingConfig config_;
    std::filesystem::path output_base_;
    EventBus& event_bus_;
    std::optional<MediaFormat> conversion_target_;
    ThreadPool pool_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace metascrub

#endif // METASCRUB_PROCESSOR_EXECUTOR_HPP
