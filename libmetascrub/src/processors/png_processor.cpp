#include "../../include/png_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <libimagequant.h>
#include <png.h>
#include <zlib.h>
#include <algorithm>
#include <array>
#include <cstring>
#include <map>
#include <memory>
#include <optional>
#include <ostream>

namespace metascrub {

namespace {

    constexpr std::string_view kTag = "png_processor";

    /**
     * @brief libpng error handler that throws a C++ exception.
     */
    void png_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
        throw EncodeError(std::string("libpng: ") + msg);
    }

    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng warning: ") + msg, "libpng");
    }

    /// Read cursor over an in-memory PNG.
    struct MemoryReader {
        std::span<const std::uint8_t> data;
        std::size_t pos = 0;
    };

    void read_from_memory(png_structp png, png_bytep out, const png_size_t len) {
        auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
        if (len > reader->data.size() - reader->pos) {
            png_error(png, "read past end of buffer");
        }
        std::memcpy(out, reader->data.data() + reader->pos, len);
        reader->pos += len;
    }

    void write_to_memory(png_structp png, png_bytep data, const png_size_t len) {
        auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
        out->insert(out->end(), data, data + len);
    }

    void flush_memory(png_structp) {}

    /**
     * @brief RAII wrapper for libpng read structs.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngRead() = default;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs.
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngWrite() = default;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    /**
     * @brief Colour-interpretation chunks read from the source, in fixed point.
     */
    struct ColorChunks {
        std::optional<int> srgb_intent;
        std::optional<png_fixed_point> gamma;
        std::optional<std::array<png_fixed_point, 8>> chrm;
        std::optional<std::array<png_uint_32, 2>> phys_ppu;
        int phys_unit = 0;
        std::optional<png_color_8> sbit;
    };

    ColorChunks read_color_chunks(png_structp png, png_infop info) {
        ColorChunks chunks;
        if (png_get_valid(png, info, PNG_INFO_sRGB)) {
            int intent = 0;
            if (png_get_sRGB(png, info, &intent)) chunks.srgb_intent = intent;
        }
        if (png_get_valid(png, info, PNG_INFO_gAMA)) {
            png_fixed_point gamma = 0;
            if (png_get_gAMA_fixed(png, info, &gamma)) chunks.gamma = gamma;
        }
        if (png_get_valid(png, info, PNG_INFO_cHRM)) {
            std::array<png_fixed_point, 8> c{};
            if (png_get_cHRM_fixed(png, info, &c[0], &c[1], &c[2], &c[3], &c[4], &c[5], &c[6], &c[7])) {
                chunks.chrm = c;
            }
        }
        if (png_get_valid(png, info, PNG_INFO_pHYs)) {
            png_uint_32 x = 0, y = 0;
            int unit = 0;
            if (png_get_pHYs(png, info, &x, &y, &unit)) {
                chunks.phys_ppu = std::array<png_uint_32, 2>{x, y};
                chunks.phys_unit = unit;
            }
        }
        if (png_get_valid(png, info, PNG_INFO_sBIT)) {
            png_color_8p sig_bit = nullptr;
            if (png_get_sBIT(png, info, &sig_bit) && sig_bit) chunks.sbit = *sig_bit;
        }
        return chunks;
    }

    void write_color_chunks(png_structp png, png_infop info, const ColorChunks& chunks, const bool same_color_type) {
        if (chunks.srgb_intent) png_set_sRGB(png, info, *chunks.srgb_intent);
        if (chunks.gamma) png_set_gAMA_fixed(png, info, *chunks.gamma);
        if (chunks.chrm) {
            const auto& c = *chunks.chrm;
            png_set_cHRM_fixed(png, info, c[0], c[1], c[2], c[3], c[4], c[5], c[6], c[7]);
        }
        if (chunks.phys_ppu) {
            png_set_pHYs(png, info, (*chunks.phys_ppu)[0], (*chunks.phys_ppu)[1], chunks.phys_unit);
        }
        // sBIT describes the source channels; it is only valid for the same layout
        if (chunks.sbit && same_color_type) {
            png_color_8 sbit = *chunks.sbit;
            png_set_sBIT(png, info, &sbit);
        }
    }

    /**
     * @brief Packs RGBA color components into a single 32-bit integer.
     */
    inline uint32_t pack_rgba(unsigned char r, unsigned char g, unsigned char b, unsigned char a) {
        return (static_cast<uint32_t>(r) << 24) |
               (static_cast<uint32_t>(g) << 16) |
               (static_cast<uint32_t>(b) << 8)  |
               (static_cast<uint32_t>(a));
    }

    /**
     * @brief Reads and decodes a PNG into an 8-bit RGBA buffer.
     */
    std::vector<unsigned char> read_to_rgba8(png_structp png, png_infop info,
                                             png_uint_32& width, png_uint_32& height) {
        int bit_depth, color_type;
        png_get_IHDR(png, info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

        if (bit_depth == 16) png_set_strip_16(png);
        if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
        if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
        if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
        if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
        png_set_interlace_handling(png);

        png_read_update_info(png, info);

        const size_t rowbytes = png_get_rowbytes(png, info);
        if (rowbytes != static_cast<size_t>(width) * 4) {
            throw EncodeError("Rowbytes mismatch, expected RGBA8");
        }

        std::vector<unsigned char> image(rowbytes * height);
        std::vector<png_bytep> row_pointers(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            row_pointers[y] = image.data() + y * rowbytes;
        }

        png_read_image(png, row_pointers.data());
        png_read_end(png, nullptr);

        return image;
    }

    /**
     * @brief A PNG decoded to RGBA8, with what the writer needs to know about the source.
     */
    struct DecodedPng {
        RgbaImage image;
        int bit_depth = 0;
        int color_type = 0;
        ColorChunks color_chunks;
    };

    DecodedPng decode_png(const std::span<const std::uint8_t> input) {
        MemoryReader reader{input, 0};
        PngRead rd;
        rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (!rd.png) throw EncodeError("png_create_read_struct failed");
        png_set_error_fn(rd.png, nullptr, png_error_fn, png_warning_fn);

        rd.info = png_create_info_struct(rd.png);
        if (!rd.info) throw EncodeError("png_create_info_struct failed");
        if (setjmp(png_jmpbuf(rd.png))) throw EncodeError("libpng read error");

        png_set_read_fn(rd.png, &reader, read_from_memory);
        png_read_info(rd.png, rd.info);

        DecodedPng decoded;
        png_uint_32 width = 0, height = 0;
        png_get_IHDR(rd.png, rd.info, &width, &height, &decoded.bit_depth, &decoded.color_type,
                     nullptr, nullptr, nullptr);
        decoded.color_chunks = read_color_chunks(rd.png, rd.info);
        decoded.image.pixels = read_to_rgba8(rd.png, rd.info, width, height);
        decoded.image.width = width;
        decoded.image.height = height;
        return decoded;
    }

    /**
     * @brief Pixel layout of a PNG about to be written.
     *
     * rows holds the packed samples: one palette index per pixel for
     * PNG_COLOR_TYPE_PALETTE, otherwise one byte per channel.
     */
    struct PngLayout {
        int color_type = PNG_COLOR_TYPE_RGBA;
        std::vector<png_color> palette;
        std::vector<png_byte> alpha; ///< tRNS entries, trailing opaque ones trimmed
        std::vector<unsigned char> rows;
    };

    void validate_image(const RgbaImage& image) {
        if (image.width == 0 || image.height == 0 ||
            image.pixels.size() != static_cast<size_t>(image.width) * image.height * 4) {
            throw EncodeError("Image buffer does not match its dimensions");
        }
    }

    /// Smallest colour type that represents image exactly; grey beats palette.
    PngLayout exact_layout(const RgbaImage& image) {
        validate_image(image);

        bool all_gray = true;
        bool all_opaque = true;
        bool can_use_palette = true;
        std::map<uint32_t, uint8_t> color_to_index_map;
        PngLayout layout;

        const unsigned char* p = image.pixels.data();
        const size_t pixel_count = static_cast<size_t>(image.width) * image.height;
        for (size_t i = 0; i < pixel_count; ++i, p += 4) {
            const unsigned char r = p[0], g = p[1], b = p[2], a = p[3];
            if (r != g || g != b) all_gray = false;
            if (a != 0xFF) all_opaque = false;

            if (can_use_palette) {
                const uint32_t color = pack_rgba(r, g, b, a);
                if (!color_to_index_map.contains(color)) {
                    if (color_to_index_map.size() >= 256) {
                        can_use_palette = false;
                    } else {
                        color_to_index_map[color] = static_cast<uint8_t>(color_to_index_map.size());
                        layout.palette.push_back({r, g, b});
                        layout.alpha.push_back(a);
                    }
                }
            }
        }

        if (all_gray && all_opaque) {
            layout.color_type = PNG_COLOR_TYPE_GRAY;
        } else if (can_use_palette) {
            layout.color_type = PNG_COLOR_TYPE_PALETTE;
        } else if (all_gray) {
            layout.color_type = PNG_COLOR_TYPE_GA;
        } else if (all_opaque) {
            layout.color_type = PNG_COLOR_TYPE_RGB;
        } else {
            layout.color_type = PNG_COLOR_TYPE_RGBA;
        }
        if (layout.color_type != PNG_COLOR_TYPE_PALETTE) {
            layout.palette.clear();
            layout.alpha.clear();
        } else if (all_opaque) {
            layout.alpha.clear();
        }

        layout.rows.reserve(pixel_count * 4);
        p = image.pixels.data();
        for (size_t i = 0; i < pixel_count; ++i, p += 4) {
            switch (layout.color_type) {
                case PNG_COLOR_TYPE_PALETTE:
                    layout.rows.push_back(color_to_index_map.at(pack_rgba(p[0], p[1], p[2], p[3])));
                    break;
                case PNG_COLOR_TYPE_GRAY:
                    layout.rows.push_back(p[0]);
                    break;
                case PNG_COLOR_TYPE_GA:
                    layout.rows.insert(layout.rows.end(), {p[0], p[3]});
                    break;
                case PNG_COLOR_TYPE_RGB:
                    layout.rows.insert(layout.rows.end(), {p[0], p[1], p[2]});
                    break;
                default:
                    layout.rows.insert(layout.rows.end(), p, p + 4);
                    break;
            }
        }
        return layout;
    }

    struct LiqAttrDeleter {
        void operator()(liq_attr* attr) const { liq_attr_destroy(attr); }
    };
    struct LiqImageDeleter {
        void operator()(liq_image* image) const { liq_image_destroy(image); }
    };
    struct LiqResultDeleter {
        void operator()(liq_result* result) const { liq_result_destroy(result); }
    };

    /// Palette of at most 256 colours chosen by libimagequant, dithered.
    PngLayout quantized_layout(const RgbaImage& image, const int quality, const int speed) {
        validate_image(image);

        const std::unique_ptr<liq_attr, LiqAttrDeleter> attr(liq_attr_create());
        if (!attr) throw EncodeError("liq_attr_create failed");
        if (liq_set_quality(attr.get(), 0, std::clamp(quality, 0, 100)) != LIQ_OK ||
            liq_set_speed(attr.get(), std::clamp(speed, 1, 10)) != LIQ_OK) {
            throw EncodeError("Invalid quantization settings");
        }

        const std::unique_ptr<liq_image, LiqImageDeleter> liq_img(liq_image_create_rgba(
            attr.get(), image.pixels.data(), static_cast<int>(image.width), static_cast<int>(image.height), 0.0));
        if (!liq_img) throw EncodeError("liq_image_create_rgba failed");

        liq_result* raw_result = nullptr;
        if (const liq_error err = liq_image_quantize(liq_img.get(), attr.get(), &raw_result); err != LIQ_OK) {
            throw EncodeError("Quantization failed (liq error " + std::to_string(static_cast<int>(err)) + ")");
        }
        const std::unique_ptr<liq_result, LiqResultDeleter> result(raw_result);
        liq_set_dithering_level(result.get(), 1.0f);

        PngLayout layout;
        layout.color_type = PNG_COLOR_TYPE_PALETTE;
        layout.rows.resize(static_cast<size_t>(image.width) * image.height);
        if (liq_write_remapped_image(result.get(), liq_img.get(), layout.rows.data(), layout.rows.size()) != LIQ_OK) {
            throw EncodeError("liq_write_remapped_image failed");
        }

        const liq_palette* palette = liq_get_palette(result.get());
        for (unsigned i = 0; i < palette->count; ++i) {
            const liq_color& c = palette->entries[i];
            layout.palette.push_back({c.r, c.g, c.b});
            layout.alpha.push_back(c.a);
        }
        while (!layout.alpha.empty() && layout.alpha.back() == 0xFF) {
            layout.alpha.pop_back();
        }
        Logger::log(LogLevel::Debug, "Quantized to " + std::to_string(palette->count) + " colours", kTag);
        return layout;
    }

    std::vector<std::uint8_t> write_png(const std::uint32_t width, const std::uint32_t height,
                                        const PngLayout& layout, const ColorChunks& color_chunks,
                                        const int src_color_type, const int zlib_level) {
        std::vector<std::uint8_t> output;

        PngWrite wr;
        wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (!wr.png) throw EncodeError("png_create_write_struct failed");
        png_set_error_fn(wr.png, nullptr, png_error_fn, png_warning_fn);
        wr.info = png_create_info_struct(wr.png);
        if (!wr.info) throw EncodeError("png_create_info_struct failed (writer)");
        if (setjmp(png_jmpbuf(wr.png))) throw EncodeError("libpng write error");

        png_set_write_fn(wr.png, &output, write_to_memory, flush_memory);

        png_set_compression_level(wr.png, std::clamp(zlib_level, 0, 9));
        png_set_compression_mem_level(wr.png, 9);
        png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
        png_set_filter(wr.png, PNG_FILTER_TYPE_BASE,
                       layout.color_type == PNG_COLOR_TYPE_PALETTE ? PNG_FILTER_NONE : PNG_ALL_FILTERS);

        png_set_IHDR(wr.png, wr.info, width, height, 8, layout.color_type,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

        if (layout.color_type == PNG_COLOR_TYPE_PALETTE) {
            png_set_PLTE(wr.png, wr.info, layout.palette.data(), static_cast<int>(layout.palette.size()));
            if (!layout.alpha.empty()) {
                png_set_tRNS(wr.png, wr.info, layout.alpha.data(), static_cast<int>(layout.alpha.size()), nullptr);
            }
        }

        write_color_chunks(wr.png, wr.info, color_chunks, layout.color_type == src_color_type);

        png_write_info(wr.png, wr.info);

        const size_t row_bytes = static_cast<size_t>(width) * png_get_channels(wr.png, wr.info);
        if (layout.rows.size() != row_bytes * height) {
            throw EncodeError("Packed rows do not match the PNG layout");
        }
        for (png_uint_32 y = 0; y < height; ++y) {
            auto* row = const_cast<png_bytep>(layout.rows.data() + y * row_bytes);
            png_write_rows(wr.png, &row, 1);
        }

        png_write_end(wr.png, nullptr);
        return output;
    }

    const ColorChunks kNoColorChunks{};

} // namespace

std::vector<std::uint8_t> PngProcessor::reencode(const std::span<const std::uint8_t> input, const int zlib_level) {
    const DecodedPng decoded = decode_png(input);
    if (decoded.bit_depth == 16) {
        throw EncodeError("16-bit PNG is not re-encoded");
    }
    return write_png(decoded.image.width, decoded.image.height, exact_layout(decoded.image),
                     decoded.color_chunks, decoded.color_type, zlib_level);
}

std::vector<std::uint8_t> PngProcessor::quantize(const std::span<const std::uint8_t> input,
                                                 const int quality, const int speed, const int zlib_level) {
    const DecodedPng decoded = decode_png(input);
    return write_png(decoded.image.width, decoded.image.height, quantized_layout(decoded.image, quality, speed),
                     decoded.color_chunks, decoded.color_type, zlib_level);
}

std::vector<std::uint8_t> PngProcessor::process(const std::span<const std::uint8_t> input,
                                                const ProcessingConfig& config) const {
    std::vector<std::uint8_t> best = engine_.strip(input, config.strip);
    if (config.strip == StripPolicy::None) {
        return best;
    }

    DecodedPng decoded;
    try {
        decoded = decode_png(best);
    } catch (const EncodeError& e) {
        Logger::log(LogLevel::Warning, std::string("Keeping stripped PNG without re-encode: ") + e.what(), kTag);
        return best;
    }

    const int level = speed_to_effort(config.speed, 9);
    auto consider = [&](const char* pass, auto&& make_layout) {
        try {
            std::vector<std::uint8_t> candidate = write_png(decoded.image.width, decoded.image.height, make_layout(),
                                                            decoded.color_chunks, decoded.color_type, level);
            if (candidate.size() < best.size()) {
                Logger::log(LogLevel::Debug, std::string(pass) + " pass saved " +
                            std::to_string(best.size() - candidate.size()) + " bytes", kTag);
                best = std::move(candidate);
            }
        } catch (const EncodeError& e) {
            Logger::log(LogLevel::Warning, std::string(pass) + " pass failed: " + e.what(), kTag);
        }
    };

    if (decoded.bit_depth == 16) {
        Logger::log(LogLevel::Debug, "16-bit PNG skips the lossless pass", kTag);
    } else {
        consider("Lossless", [&] { return exact_layout(decoded.image); });
    }
    if (!config.no_lossy) {
        consider("Quantize", [&] { return quantized_layout(decoded.image, config.quality, config.speed); });
    }
    return best;
}

RgbaImage PngProcessor::decode_image(const std::span<const std::uint8_t> input) const {
    return decode_png(input).image;
}

std::vector<std::uint8_t> PngProcessor::encode_image(const RgbaImage& image, const ProcessingConfig& config) const {
    const int level = speed_to_effort(config.speed, 9);
    std::vector<std::uint8_t> out = write_png(image.width, image.height, exact_layout(image),
                                              kNoColorChunks, -1, level);
    if (config.no_lossy) {
        return out;
    }
    try {
        std::vector<std::uint8_t> lossy = write_png(image.width, image.height,
                                                    quantized_layout(image, config.quality, config.speed),
                                                    kNoColorChunks, -1, level);
        if (lossy.size() < out.size()) out = std::move(lossy);
    } catch (const EncodeError& e) {
        Logger::log(LogLevel::Warning, std::string("Quantize pass failed, writing lossless PNG: ") + e.what(), kTag);
    }
    return out;
}

void PngProcessor::inspect(const std::span<const std::uint8_t> input, std::ostream& out) const {
    engine_.inspect(input, out);

    MemoryReader reader{input, 0};
    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!rd.png) return;
    png_set_error_fn(rd.png, nullptr, png_error_fn, png_warning_fn);
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) return;

    try {
        if (setjmp(png_jmpbuf(rd.png))) throw EncodeError("libpng read error");
        png_set_read_fn(rd.png, &reader, read_from_memory);
        png_read_info(rd.png, rd.info);
        png_uint_32 width = 0, height = 0;
        const auto pixels = read_to_rgba8(rd.png, rd.info, width, height);
        out << "Pixel data: decodes cleanly (" << width << "x" << height << ", "
            << pixels.size() << " bytes as RGBA8)\n";
    } catch (const EncodeError& e) {
        out << "Pixel data: decode failed (" << e.what() << ")\n";
    }
}

} // namespace metascrub
