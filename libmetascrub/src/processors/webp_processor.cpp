#include "../../include/webp_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/mux.h>
#include <memory>
#include <ostream>

namespace metascrub {

namespace {

constexpr std::string_view kTag = "webp_processor";

struct WebpBufferDeleter {
    void operator()(uint8_t* p) const { WebPFree(p); }
};

struct MuxDeleter {
    void operator()(WebPMux* mux) const { WebPMuxDelete(mux); }
};

using unique_webp_buffer = std::unique_ptr<uint8_t, WebpBufferDeleter>;
using unique_mux = std::unique_ptr<WebPMux, MuxDeleter>;

/**
 * @brief RAII owner of a WebPPicture and the memory writer it encodes into.
 */
struct EncodeTarget {
    WebPPicture picture{};
    WebPMemoryWriter writer{};

    EncodeTarget() {
        if (!WebPPictureInit(&picture)) {
            throw EncodeError("WebPPictureInit failed");
        }
        WebPMemoryWriterInit(&writer);
        picture.writer = WebPMemoryWrite;
        picture.custom_ptr = &writer;
    }

    ~EncodeTarget() {
        WebPPictureFree(&picture);
        WebPMemoryWriterClear(&writer);
    }

    EncodeTarget(const EncodeTarget&) = delete;
    EncodeTarget& operator=(const EncodeTarget&) = delete;
};

/**
 * @brief Returns the WebPMux animation flag of data, or false if the mux
 * cannot parse it.
 */
bool is_animated(const std::span<const std::uint8_t> data) {
    const WebPData webp_data{data.data(), data.size()};
    const unique_mux mux(WebPMuxCreate(&webp_data, 0));
    if (!mux) return false;
    uint32_t flags = 0;
    if (WebPMuxGetFeatures(mux.get(), &flags) != WEBP_MUX_OK) return false;
    return (flags & ANIMATION_FLAG) != 0;
}

/// Encodes packed RGBA (or RGB when has_alpha is false) pixels.
std::vector<std::uint8_t> encode_pixels(const uint8_t* pixels, const int width, const int height,
                                        const bool has_alpha, const bool lossless,
                                        const ProcessingConfig& config) {
    WebPConfig webp_config;
    if (lossless) {
        if (!WebPConfigInit(&webp_config) ||
            !WebPConfigLosslessPreset(&webp_config, speed_to_effort(config.speed, 9))) {
            throw EncodeError("WebPConfigLosslessPreset failed");
        }
    } else {
        if (!WebPConfigPreset(&webp_config, WEBP_PRESET_DEFAULT, static_cast<float>(config.quality))) {
            throw EncodeError("WebPConfigPreset failed");
        }
        webp_config.method = speed_to_effort(config.speed, 6);
    }
    if (!WebPValidateConfig(&webp_config)) {
        throw EncodeError("Invalid WebP encoder configuration");
    }

    EncodeTarget target;
    target.picture.use_argb = lossless ? 1 : 0;
    target.picture.width = width;
    target.picture.height = height;
    const int imported = has_alpha
        ? WebPPictureImportRGBA(&target.picture, pixels, width * 4)
        : WebPPictureImportRGB(&target.picture, pixels, width * 3);
    if (!imported) {
        throw EncodeError("WebPPictureImport failed");
    }

    if (!WebPEncode(&webp_config, &target.picture)) {
        throw EncodeError("WebPEncode failed (error " + std::to_string(target.picture.error_code) + ")");
    }
    return {target.writer.mem, target.writer.mem + target.writer.size};
}

std::vector<std::uint8_t> reencode(const std::span<const std::uint8_t> input,
                                   const WebPBitstreamFeatures& features,
                                   const bool lossless,
                                   const ProcessingConfig& config) {
    int width = 0, height = 0;
    const bool alpha = features.has_alpha != 0;
    const unique_webp_buffer decoded(alpha
        ? WebPDecodeRGBA(input.data(), input.size(), &width, &height)
        : WebPDecodeRGB(input.data(), input.size(), &width, &height));
    if (!decoded) {
        throw EncodeError("WebP decode failed");
    }
    return encode_pixels(decoded.get(), width, height, alpha, lossless, config);
}

} // namespace

std::vector<std::uint8_t> WebpProcessor::process(const std::span<const std::uint8_t> input,
                                                 const ProcessingConfig& config) const {
    std::vector<std::uint8_t> stripped = engine_.strip(input, config.strip);
    if (config.strip == StripPolicy::None) {
        return stripped;
    }

    WebPBitstreamFeatures features;
    if (WebPGetFeatures(stripped.data(), stripped.size(), &features) != VP8_STATUS_OK) {
        Logger::log(LogLevel::Warning, "Bitstream feature detection failed, keeping stripped WebP", kTag);
        return stripped;
    }
    if (features.has_animation || is_animated(stripped)) {
        Logger::log(LogLevel::Debug, "Animated WebP is stripped but not re-encoded", kTag);
        return stripped;
    }

    // format: 0 undefined/mixed, 1 lossy, 2 lossless
    const bool lossless = features.format == 2 || config.no_lossy;

    std::vector<std::uint8_t> reencoded;
    try {
        reencoded = reencode(stripped, features, lossless, config);
    } catch (const EncodeError& e) {
        Logger::log(LogLevel::Warning, std::string("Keeping stripped WebP without re-encode: ") + e.what(), kTag);
        return stripped;
    }

    if (reencoded.size() < stripped.size()) {
        Logger::log(LogLevel::Debug,
                    std::string(lossless ? "Lossless" : "Lossy") + " re-encode saved " +
                    std::to_string(stripped.size() - reencoded.size()) + " bytes",
                    kTag);
        return reencoded;
    }
    Logger::log(LogLevel::Debug, "Re-encode not smaller, keeping stripped WebP", kTag);
    return stripped;
}

RgbaImage WebpProcessor::decode_image(const std::span<const std::uint8_t> input) const {
    int width = 0, height = 0;
    const unique_webp_buffer decoded(WebPDecodeRGBA(input.data(), input.size(), &width, &height));
    if (!decoded || width <= 0 || height <= 0) {
        throw EncodeError("WebP decode failed");
    }
    RgbaImage image;
    image.width = static_cast<std::uint32_t>(width);
    image.height = static_cast<std::uint32_t>(height);
    image.pixels.assign(decoded.get(), decoded.get() + static_cast<size_t>(width) * height * 4);
    return image;
}

std::vector<std::uint8_t> WebpProcessor::encode_image(const RgbaImage& image, const ProcessingConfig& config) const {
    if (image.width == 0 || image.height == 0 ||
        image.pixels.size() != static_cast<size_t>(image.width) * image.height * 4) {
        throw EncodeError("Image buffer does not match its dimensions");
    }
    // WebP stores at most 16383 pixels per side
    if (image.width > WEBP_MAX_DIMENSION || image.height > WEBP_MAX_DIMENSION) {
        throw EncodeError("Image too large for WebP: " + std::to_string(image.width) + "x" +
                          std::to_string(image.height));
    }
    return encode_pixels(image.pixels.data(), static_cast<int>(image.width), static_cast<int>(image.height),
                         true, config.no_lossy, config);
}

void WebpProcessor::inspect(const std::span<const std::uint8_t> input, std::ostream& out) const {
    engine_.inspect(input, out);

    WebPBitstreamFeatures features;
    if (WebPGetFeatures(input.data(), input.size(), &features) != VP8_STATUS_OK) {
        out << "Bitstream: libwebp could not read the features\n";
        return;
    }
    out << "Bitstream: " << features.width << "x" << features.height << ", "
        << (features.format == 2 ? "lossless" : features.format == 1 ? "lossy" : "mixed")
        << (features.has_alpha ? ", alpha" : "") << "\n";

    if (features.has_animation) {
        const WebPData webp_data{input.data(), input.size()};
        const unique_mux mux(WebPMuxCreate(&webp_data, 0));
        int frames = 0;
        if (mux && WebPMuxNumChunks(mux.get(), WEBP_CHUNK_ANMF, &frames) == WEBP_MUX_OK) {
            out << "Animation: " << frames << " frames\n";
        } else {
            out << "Animation: frame count unavailable\n";
        }
    }
}

} // namespace metascrub
