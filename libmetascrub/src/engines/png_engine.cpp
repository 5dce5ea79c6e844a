#include "../../include/png_engine.hpp"
#include "../../include/byte_io.hpp"
#include "../../include/inspect_util.hpp"
#include "../../include/logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace metascrub {

namespace {

constexpr std::size_t kChunkOverhead = 12; // length + type + CRC
constexpr std::size_t kTextDisplayLimit = 60;
constexpr std::size_t kInflateLimit = 64 * 1024;

constexpr std::array<std::string_view, 6> kSafeAncillary = {
    "tRNS", "gAMA", "cHRM", "sRGB", "sBIT", "pHYs"
};

const char* describe_chunk(const std::string_view id) {
    if (id == "IHDR") return "Image Header";
    if (id == "PLTE") return "Palette";
    if (id == "IDAT") return "Image Data";
    if (id == "IEND") return "Image End";
    if (id == "tRNS") return "Transparency";
    if (id == "gAMA") return "Gamma";
    if (id == "cHRM") return "Chromaticity";
    if (id == "sRGB") return "Standard RGB Color Space";
    if (id == "iCCP") return "ICC Color Profile";
    if (id == "tEXt") return "Textual Data";
    if (id == "zTXt") return "Compressed Textual Data";
    if (id == "iTXt") return "International Textual Data";
    if (id == "bKGD") return "Background Color";
    if (id == "pHYs") return "Physical Pixel Dimensions";
    if (id == "tIME") return "Last Modification Time";
    if (id == "sBIT") return "Significant Bits";
    if (id == "sPLT") return "Suggested Palette";
    if (id == "hIST") return "Histogram";
    if (id == "eXIf") return "EXIF Data";
    return "Unknown/Custom Chunk";
}

/**
 * @brief Inflates a zlib stream, stopping after limit bytes of output.
 * @throws DecodeError if the stream is corrupt.
 */
std::string inflate_text(const std::span<const std::uint8_t> data, const std::size_t limit) {
    std::string out(std::min<std::size_t>(limit, 4096), '\0');

    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    if (inflateInit(&strm) != Z_OK) {
        throw DecodeError("inflateInit failed");
    }

    int ret = Z_OK;
    while (ret != Z_STREAM_END && strm.total_out < limit) {
        if (strm.total_out >= out.size()) {
            out.resize(std::min(out.size() * 2, limit));
        }
        strm.next_out = reinterpret_cast<Bytef*>(out.data() + strm.total_out);
        strm.avail_out = static_cast<uInt>(out.size() - strm.total_out);

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_NEED_DICT) {
            inflateEnd(&strm);
            throw DecodeError("inflate failed");
        }
        if (ret == Z_BUF_ERROR && strm.avail_in == 0) {
            break; // truncated stream: keep what was produced
        }
    }

    out.resize(strm.total_out);
    inflateEnd(&strm);
    return out;
}

std::string shorten(const std::string& text) {
    if (text.size() <= kTextDisplayLimit) return text;
    return text.substr(0, kTextDisplayLimit) + "...";
}

std::string latin1_view(const std::span<const std::uint8_t> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

void describe_text_chunk(const ContainerRecord& record, std::ostream& out) {
    const auto data = record.payload;
    const auto nul = std::ranges::find(data, std::uint8_t{0});
    if (nul == data.end()) return;

    const auto key_len = static_cast<std::size_t>(nul - data.begin());
    const std::string keyword = latin1_view(data.first(key_len));
    const auto rest = data.subspan(key_len + 1);
    std::string value = "<compressed or binary>";

    try {
        if (record.id == "tEXt") {
            value = latin1_view(rest);
        } else if (record.id == "zTXt" && !rest.empty()) {
            value = inflate_text(rest.subspan(1), kInflateLimit);
        } else if (record.id == "iTXt" && rest.size() >= 2) {
            const bool compressed = rest[0] != 0;
            // skip language tag and translated keyword
            auto text = rest.subspan(2);
            for (int field = 0; field < 2; ++field) {
                const auto end = std::ranges::find(text, std::uint8_t{0});
                if (end == text.end()) return;
                text = text.subspan(static_cast<std::size_t>(end - text.begin()) + 1);
            }
            value = compressed ? inflate_text(text, kInflateLimit) : latin1_view(text);
        }
    } catch (const DecodeError& e) {
        value = std::string("<undecodable: ") + e.what() + ">";
    }

    out << "      " << keyword << ": " << shorten(value) << "\n";
}

void describe_content(const ContainerRecord& record, std::ostream& out) {
    const auto data = record.payload;
    if (record.id == "IHDR" && data.size() >= 13) {
        out << "      " << read_u32_be(data, 0) << "x" << read_u32_be(data, 4)
            << ", bit depth: " << static_cast<int>(data[8])
            << ", color type: " << static_cast<int>(data[9])
            << ", interlace: " << (data[12] ? "Adam7" : "none") << "\n";
    } else if (record.id == "tEXt" || record.id == "zTXt" || record.id == "iTXt") {
        describe_text_chunk(record, out);
    } else if (record.id == "pHYs" && data.size() >= 9) {
        out << "      " << read_u32_be(data, 0) << "x" << read_u32_be(data, 4) << " pixels per "
            << (data[8] == 1 ? "meter" : "unit") << "\n";
    } else if (record.id == "tIME" && data.size() >= 7) {
        std::ostringstream oss;
        oss << read_u16_be(data, 0) << "-" << std::setfill('0')
            << std::setw(2) << static_cast<int>(data[2]) << "-"
            << std::setw(2) << static_cast<int>(data[3]) << " "
            << std::setw(2) << static_cast<int>(data[4]) << ":"
            << std::setw(2) << static_cast<int>(data[5]) << ":"
            << std::setw(2) << static_cast<int>(data[6]);
        out << "      " << oss.str() << "\n";
    } else if (record.id == "gAMA" && data.size() >= 4) {
        out << "      Gamma: " << std::fixed << std::setprecision(5)
            << static_cast<double>(read_u32_be(data, 0)) / 100000.0 << "\n";
    } else if (record.id == "eXIf" || record.id == "iCCP") {
        out << "      Contains " << describe_chunk(record.id) << " (" << data.size() << " bytes)\n";
    }
}

} // namespace

bool has_png_signature(const std::span<const std::uint8_t> input) noexcept {
    return input.size() >= kPngSignature.size() &&
           std::equal(kPngSignature.begin(), kPngSignature.end(), input.begin());
}

std::vector<ContainerRecord> PngEngine::walk(const std::span<const std::uint8_t> input) const {
    if (!has_png_signature(input)) {
        throw DecodeError("Invalid PNG signature");
    }

    std::vector<ContainerRecord> records;
    std::size_t pos = kPngSignature.size();

    while (pos < input.size()) {
        const std::size_t remaining = input.size() - pos;
        if (remaining < kChunkOverhead) {
            throw DecodeError("Truncated PNG chunk at offset " + std::to_string(pos));
        }

        const std::uint32_t length = read_u32_be(input, pos);
        if (length > remaining - kChunkOverhead) {
            throw DecodeError("PNG chunk at offset " + std::to_string(pos) + " declares " +
                              std::to_string(length) + " bytes but only " +
                              std::to_string(remaining - kChunkOverhead) + " remain");
        }

        ContainerRecord record;
        record.id = tag_view(input, pos + 4);
        record.payload = input.subspan(pos + 8, length);
        record.byte_length = length;
        record.offset = pos;
        record.crc = read_u32_be(input, pos + 8 + length);
        records.push_back(record);

        pos += kChunkOverhead + length;
        if (record.id == "IEND") {
            if (pos < input.size()) {
                Logger::log(LogLevel::Debug,
                            "Ignoring " + std::to_string(input.size() - pos) + " bytes after IEND", name());
            }
            break;
        }
    }

    return records;
}

ChunkClass PngEngine::classify(const std::string_view id) const noexcept {
    if (id.empty()) return ChunkClass::Unsafe;
    if ((static_cast<unsigned char>(id[0]) & 0x20) == 0) return ChunkClass::Essential;
    if (std::ranges::find(kSafeAncillary, id) != kSafeAncillary.end()) return ChunkClass::Safe;
    return ChunkClass::Unsafe;
}

bool PngEngine::retains(const ChunkClass cls, const StripPolicy policy) const noexcept {
    // textual, time and EXIF chunks are dropped under both All and Safe
    if (policy == StripPolicy::None) return true;
    return cls != ChunkClass::Unsafe;
}

std::vector<std::uint8_t> PngEngine::reconstruct(const std::span<const std::uint8_t> input,
                                                 const std::vector<ContainerRecord>& records,
                                                 const StripPolicy policy) const {
    std::vector<std::uint8_t> out;
    out.reserve(input.size());
    out.insert(out.end(), kPngSignature.begin(), kPngSignature.end());

    for (const auto& record : records) {
        if (!retains(classify(record.id), policy)) {
            Logger::log(LogLevel::Debug,
                        "Dropping chunk '" + std::string(record.id) + "' (" +
                        std::to_string(record.byte_length) + " bytes)",
                        name());
            continue;
        }
        append_u32_be(out, record.byte_length);
        append_tag(out, record.id);
        append_bytes(out, record.payload);
        append_u32_be(out, record.crc);
    }
    return out;
}

void PngEngine::inspect(const std::span<const std::uint8_t> input, std::ostream& out) const {
    write_banner(out, "PNG Metadata Inspection");
    out << "File size: " << input.size() << " bytes (" << format_size(input.size()) << ")\n\n";

    std::vector<ContainerRecord> records;
    try {
        records = walk(input);
    } catch (const DecodeError& e) {
        out << "Chunk walk failed: " << e.what() << "\n";
        write_footer(out);
        return;
    }

    out << "PNG Chunks:\n";
    write_rule(out);

    std::size_t critical = 0;
    std::size_t bad_crc = 0;
    std::size_t metadata_bytes = 0;
    for (const auto& record : records) {
        const ChunkClass cls = classify(record.id);
        const bool is_critical = cls == ChunkClass::Essential;
        if (is_critical) ++critical;

        // CRC covers type and payload
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(record.id.data()), 4);
        crc = crc32(crc, record.payload.data(), static_cast<uInt>(record.payload.size()));
        const bool crc_ok = static_cast<std::uint32_t>(crc) == record.crc;
        if (!crc_ok) ++bad_crc;

        out << "  " << (is_critical ? "[CRITICAL]" : "[ANCILLARY]") << " " << record.id << " - "
            << describe_chunk(record.id) << (cls == ChunkClass::Unsafe ? " (strippable)" : "") << "\n";
        out << "      Size: " << record.byte_length << " bytes, CRC: " << (crc_ok ? "ok" : "MISMATCH") << "\n";
        describe_content(record, out);
        out << "\n";

        if (cls == ChunkClass::Unsafe) metadata_bytes += kChunkOverhead + record.byte_length;
    }

    write_rule(out);
    out << "Summary: " << records.size() << " total chunks (" << critical << " critical, "
        << records.size() - critical << " ancillary), " << format_size(metadata_bytes) << " strippable";
    if (bad_crc > 0) out << ", " << bad_crc << " CRC mismatches";
    out << "\n";
    write_footer(out);
}

} // namespace metascrub
