/**
 * @file log_sink.hpp
 * @brief Log levels and the sink interface behind Logger.
 */

#ifndef METASCRUB_LOG_SINK_HPP
#define METASCRUB_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Per-record decisions of the engines
    Info,    ///< One line per processed file
    Warning, ///< Tolerated damage in an input
    Error    ///< A file could not be processed
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file). Logger
 * delegates to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (engine or processor name).
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // METASCRUB_LOG_SINK_HPP
