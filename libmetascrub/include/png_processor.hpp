/**
 * @file png_processor.hpp
 * @brief IProcessor for PNG files: chunk strip, lossless re-encode and palette quantization.
 */

#ifndef METASCRUB_PNG_PROCESSOR_HPP
#define METASCRUB_PNG_PROCESSOR_HPP

#include "png_engine.hpp"
#include "processor.hpp"
#include <array>
#include <span>
#include <string_view>

namespace metascrub {

    /**
     * @brief Implements IProcessor for PNG files using PngEngine and libpng.
     *
     * @details After the engine has removed the chunks the policy rejects,
     * the image is decoded to RGBA8 and up to two candidates are written:
     * - lossless, with the smallest colour type that represents it exactly
     *   (palette, grey, grey+alpha, RGB or RGBA);
     * - unless ProcessingConfig::no_lossy, a palette of at most 256
     *   colours chosen by libimagequant at ProcessingConfig::quality.
     *
     * Both use the zlib level derived from ProcessingConfig::speed and carry
     * over the retained colour chunks (sRGB, gAMA, cHRM, pHYs, and sBIT when
     * the colour type is unchanged). The smallest of the stripped file and
     * the candidates is returned.
     */
    class PngProcessor final : public IProcessor {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngProcessor";
        }

        [[nodiscard]] MediaFormat get_format() const noexcept override { return MediaFormat::Png; }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/png" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        // --- operations ---

        /**
         * @brief Strips chunks, then tries the lossless and quantized passes.
         *
         * Under StripPolicy::None the input is returned unchanged. 16-bit
         * images skip the lossless pass.
         */
        [[nodiscard]] std::vector<std::uint8_t> process(std::span<const std::uint8_t> input,
                                                        const ProcessingConfig& config) const override;

        /// Chunk dump followed by a libpng decode check.
        void inspect(std::span<const std::uint8_t> input, std::ostream& out) const override;

        /**
         * @brief Decodes input and re-encodes it with the smallest exact colour type.
         * @param input A complete PNG.
         * @param zlib_level 0-9.
         * @return The re-encoded PNG.
         * @throws EncodeError if libpng reports an error, or for 16-bit input.
         */
        [[nodiscard]] static std::vector<std::uint8_t> reencode(std::span<const std::uint8_t> input, int zlib_level);

        /**
         * @brief Decodes input and writes it as a libimagequant palette image.
         * @param quality Upper quality bound, 0-100; lower values allow fewer colours.
         * @param speed 1 (slowest, best) to 10.
         * @throws EncodeError if decoding or quantization fails.
         */
        [[nodiscard]] static std::vector<std::uint8_t> quantize(std::span<const std::uint8_t> input,
                                                                int quality, int speed, int zlib_level);

        [[nodiscard]] bool can_convert() const noexcept override { return true; }

        [[nodiscard]] RgbaImage decode_image(std::span<const std::uint8_t> input) const override;

        /// Lossless PNG, or the quantized one when lossy output is allowed and smaller.
        [[nodiscard]] std::vector<std::uint8_t> encode_image(const RgbaImage& image,
                                                             const ProcessingConfig& config) const override;

    private:
        PngEngine engine_;
    };

} // namespace metascrub

#endif // METASCRUB_PNG_PROCESSOR_HPP
