#ifndef METASCRUB_CONSOLE_LOG_SINK_HPP
#define METASCRUB_CONSOLE_LOG_SINK_HPP

#include "../../../libmetascrub/include/log_sink.hpp"
#include "../../../libmetascrub/include/logger.hpp"
#include <iostream>

/**
 * @brief Writes messages at or above log_level to the terminal.
 *
 * Debug and info go to stdout, warnings and errors to stderr.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;
        std::ostream& out = level >= LogLevel::Warning ? std::cerr : std::cout;
        switch (level) {
            case LogLevel::Debug:   out << "[DEBUG]"; break;
            case LogLevel::Info:    out << "[INFO ]"; break;
            case LogLevel::Warning: out << "[WARN ]"; break;
            case LogLevel::Error:   out << "[ERROR]"; break;
        }
        out << "[" << tag << "] " << message << std::endl;
    }
};

#endif // METASCRUB_CONSOLE_LOG_SINK_HPP
