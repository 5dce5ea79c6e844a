#ifndef METASCRUB_FILE_LOG_SINK_HPP
#define METASCRUB_FILE_LOG_SINK_HPP

#include "../../../libmetascrub/include/log_sink.hpp"
#include "../../../libmetascrub/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <string>

/**
 * @brief Writes every message, whatever its level, to a log file.
 *
 * Lines look like `2025-01-31 14:02:11 [INFO][wav] message`, local time.
 */
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::string& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::lock_guard lock(mtx_);
        if (!out_.is_open()) return;
        out_ << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
             << " [" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << std::endl;
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // METASCRUB_FILE_LOG_SINK_HPP
