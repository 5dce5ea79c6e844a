/**
 * @file webp_processor.hpp
 * @brief IProcessor for WebP files: chunk strip plus a libwebp re-encode.
 */

#ifndef METASCRUB_WEBP_PROCESSOR_HPP
#define METASCRUB_WEBP_PROCESSOR_HPP

#include "processor.hpp"
#include "webp_engine.hpp"
#include <array>
#include <span>
#include <string_view>

namespace metascrub {

/**
 * @brief Implements IProcessor for WebP images using WebpEngine and libwebp.
 *
 * @details The engine strips first. Still images are then decoded and
 * re-encoded: losslessly when the source is VP8L or lossy re-encoding is
 * disabled, otherwise lossily at ProcessingConfig::quality. Animated files
 * are only stripped. The re-encoded file wins only if it is smaller.
 */
class WebpProcessor final : public IProcessor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "WebpProcessor";
    }

    [[nodiscard]] MediaFormat get_format() const noexcept override { return MediaFormat::Webp; }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 1> kMimes = { "image/webp" };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 1> kExts = { ".webp" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] std::vector<std::uint8_t> process(std::span<const std::uint8_t> input,
                                                    const ProcessingConfig& config) const override;

    /// Chunk dump followed by the bitstream features libwebp reports.
    void inspect(std::span<const std::uint8_t> input, std::ostream& out) const override;

    [[nodiscard]] bool can_convert() const noexcept override { return true; }

    /// Still images only; libwebp refuses to decode animations this way.
    [[nodiscard]] RgbaImage decode_image(std::span<const std::uint8_t> input) const override;

    /// Lossless with ProcessingConfig::no_lossy, lossy at ProcessingConfig::quality otherwise.
    [[nodiscard]] std::vector<std::uint8_t> encode_image(const RgbaImage& image,
                                                         const ProcessingConfig& config) const override;

private:
    WebpEngine engine_;
};

} // namespace metascrub

#endif // METASCRUB_WEBP_PROCESSOR_HPP
