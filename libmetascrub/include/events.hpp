/**
 * @file events.hpp
 * @brief Events published by ProcessorExecutor for every input file.
 *
 * Exactly one of Complete, Error or Skipped follows each Start event.
 */

#ifndef METASCRUB_EVENTS_HPP
#define METASCRUB_EVENTS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace metascrub {

/**
 * @brief Emitted when a worker picks up a file.
 */
struct FileProcessStartEvent {
    std::filesystem::path path;
    std::string mime;           ///< Detected MIME type, empty if libmagic had none
};

/**
 * @brief Emitted when a file was stripped and the result is smaller.
 */
struct FileProcessCompleteEvent {
    std::filesystem::path path;            ///< Input file
    std::filesystem::path output;          ///< Where the result was (or would be) written
    uintmax_t original_size = 0;           ///< Input size in bytes
    uintmax_t new_size = 0;                ///< Result size in bytes
    bool replaced = false;                 ///< False in dry-run mode
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a file could not be processed.
 */
struct FileProcessErrorEvent {
    std::filesystem::path path;
    std::string error_message;
};

/**
 * @brief Emitted when a file was left alone (unsupported, no improvement).
 */
struct FileProcessSkippedEvent {
    std::filesystem::path path;
    std::string reason;
};

} // namespace metascrub

#endif // METASCRUB_EVENTS_HPP
