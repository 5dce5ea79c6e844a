/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Logger is the single entry point for all logging in the library. Engines
 * and processors never write to a stream directly; they call Logger::log
 * and the CLI decides where the messages end up by installing sinks.
 */

#ifndef METASCRUB_LOGGER_HPP
#define METASCRUB_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for metascrub.
 *
 * With no sink installed every message is discarded, which is the state
 * the unit tests run in.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// Remove all configured sinks.
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "metascrub").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "metascrub");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     * @return A constant string (e.g., "DEBUG", "INFO").
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parses a level name as written on the command line.
     * Case-insensitive; accepts "WARN" and "WARNING".
     * @return The level, or std::nullopt if the name is unknown.
     */
    static std::optional<LogLevel> string_to_level(std::string_view level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif // METASCRUB_LOGGER_HPP
