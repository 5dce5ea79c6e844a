/**
 * @file processor.hpp
 * @brief Defines the per-format processor interface.
 */

#ifndef METASCRUB_PROCESSOR_HPP
#define METASCRUB_PROCESSOR_HPP

#include "errors.hpp"
#include "media_format.hpp"
#include "processing_config.hpp"
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @namespace metascrub
 * @brief The main namespace for the metascrub library.
 *
 * @details Contains the container engines (PngEngine, WebpEngine,
 * WavEngine, Id3Engine), the IProcessor layer that wraps them with
 * codec passes, and the execution machinery (ProcessorRegistry,
 * ProcessorExecutor).
 */
namespace metascrub {

/**
 * @brief Decoded still image, 8 bits per channel, RGBA order, rows packed.
 */
struct RgbaImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> pixels; ///< width * height * 4 bytes
};

/**
 * @brief Interface for a file processing module.
 *
 * Each implementation targets one MediaFormat. It describes which MIME
 * types and extensions it handles and turns the bytes of a file into
 * the bytes of its stripped (and possibly re-compressed) replacement.
 *
 * Implementations are stateless with respect to the files they process;
 * the ProcessorRegistry owns one instance per format and shares it across
 * worker threads.
 */
class IProcessor {
public:
    virtual ~IProcessor() = default;

    // --- self-description ---

    /// @return Human-readable name of the processor (e.g. "PngProcessor").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The format this processor handles.
    [[nodiscard]] virtual MediaFormat get_format() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view, std::dynamic_extent>
    get_supported_mime_types() const noexcept = 0;

    /// @return List of supported file extensions (e.g. ".png").
    [[nodiscard]] virtual std::span<const std::string_view, std::dynamic_extent>
    get_supported_extensions() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Strips metadata according to config.strip and re-compresses
     * where the format has a codec pass.
     * @param input The whole file.
     * @param config Run options.
     * @return The bytes to write in place of input.
     * @throws DecodeError if input does not parse as this format.
     * @throws EncodeError if a codec pass fails.
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> process(std::span<const std::uint8_t> input,
                                                            const ProcessingConfig& config) const = 0;

    /**
     * @brief Writes a human-readable metadata report for input to out.
     */
    virtual void inspect(std::span<const std::uint8_t> input, std::ostream& out) const = 0;

    // --- image conversion ---

    /// @return true if decode_image() and encode_image() are implemented.
    [[nodiscard]] virtual bool can_convert() const noexcept { return false; }

    /**
     * @brief Decodes the pixels of input.
     * @throws UnsupportedFormatError unless can_convert().
     * @throws EncodeError if the codec rejects input.
     */
    [[nodiscard]] virtual RgbaImage decode_image(std::span<const std::uint8_t> /*input*/) const {
        throw UnsupportedFormatError(std::string(get_name()) + " cannot decode images");
    }

    /**
     * @brief Encodes image in this processor's format, without metadata.
     *
     * config.quality and config.no_lossy select lossy or lossless output;
     * config.speed sets the encoder effort.
     * @throws UnsupportedFormatError unless can_convert().
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> encode_image(const RgbaImage& /*image*/,
                                                                 const ProcessingConfig& /*config*/) const {
        throw UnsupportedFormatError(std::string(get_name()) + " cannot encode images");
    }
};

} // namespace metascrub

#endif // METASCRUB_PROCESSOR_HPP
