/**
 * @file wav_processor.hpp
 * @brief IProcessor for WAV files.
 */

#ifndef METASCRUB_WAV_PROCESSOR_HPP
#define METASCRUB_WAV_PROCESSOR_HPP

#include "processor.hpp"
#include "wav_engine.hpp"
#include <array>
#include <span>
#include <string_view>

namespace metascrub {

/**
 * @brief Implements IProcessor for WAV files. Audio is never re-encoded;
 * the result is the WavEngine strip.
 */
class WavProcessor final : public IProcessor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "WavProcessor";
    }

    [[nodiscard]] MediaFormat get_format() const noexcept override { return MediaFormat::Wav; }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 3> kMimes = { "audio/wav", "audio/x-wav", "audio/vnd.wave" };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 2> kExts = { ".wav", ".wave" };
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
    WavEngine engine_;
};

} // namespace metascrub

#endif // METASCRUB_WAV_PROCESSOR_HPP
