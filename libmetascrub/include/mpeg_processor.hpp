/**
 * @file mpeg_processor.hpp
 * @brief IProcessor for MP3 files.
 */

#ifndef METASCRUB_MPEG_PROCESSOR_HPP
#define METASCRUB_MPEG_PROCESSOR_HPP

#include "id3_engine.hpp"
#include "processor.hpp"
#include <array>
#include <span>
#include <string_view>

namespace metascrub {

/**
 * @brief Implements IProcessor for MP3 files through Id3Engine.
 *
 * The MPEG frames themselves are copied untouched.
 */
class MpegProcessor final : public IProcessor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "MpegProcessor";
    }

    [[nodiscard]] MediaFormat get_format() const noexcept override { return MediaFormat::Mp3; }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 2> kMimes = { "audio/mpeg", "audio/mp3" };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 1> kExts = { ".mp3" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] std::vector<std::uint8_t> process(const std::span<const std::uint8_t> input,
                                                    const ProcessingConfig& config) const override {
        return engine_.strip(input, config.strip);
    }

    void inspect(const std::span<const std::uint8_t> input, std::ostream& out) const override {
        engine_.inspect(input, out);
    }

private:
    Id3Engine engine_;
};

} // namespace metascrub

#endif // METASCRUB_MPEG_PROCESSOR_HPP
