#ifndef METASCRUB_TESTS_RECORDING_SINK_HPP
#define METASCRUB_TESTS_RECORDING_SINK_HPP

#include "../libmetascrub/include/log_sink.hpp"
#include "../libmetascrub/include/logger.hpp"
#include <string>
#include <vector>

namespace metascrub::test {

/// Captures log lines as "LEVEL|tag|message".
class RecordingSink final : public ILogSink {
public:
    explicit RecordingSink(std::vector<std::string>& lines) : lines_(lines) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        lines_.push_back(std::string(Logger::level_to_string(level)) + "|" + std::string(tag) + "|" +
                         std::string(message));
    }

private:
    std::vector<std::string>& lines_;
};

} // namespace metascrub::test

#endif // METASCRUB_TESTS_RECORDING_SINK_HPP
