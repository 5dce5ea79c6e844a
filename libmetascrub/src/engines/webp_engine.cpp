#include "../../include/webp_engine.hpp"
#include "../../include/byte_io.hpp"
#include "../../include/inspect_util.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <ostream>

namespace metascrub {

namespace {

// VP8X feature flags (first payload byte)
constexpr std::uint8_t kIccFlag = 0x20;
constexpr std::uint8_t kAlphaFlag = 0x10;
constexpr std::uint8_t kExifFlag = 0x08;
constexpr std::uint8_t kXmpFlag = 0x04;
constexpr std::uint8_t kAnimationFlag = 0x02;

const char* describe_chunk(const std::string_view id) {
    if (id == "VP8 ") return "Lossy VP8 bitstream";
    if (id == "VP8L") return "Lossless VP8L bitstream";
    if (id == "VP8X") return "Extended file format";
    if (id == "ANIM") return "Animation parameters";
    if (id == "ANMF") return "Animation frame";
    if (id == "ALPH") return "Alpha channel";
    if (id == "ICCP") return "ICC color profile";
    if (id == "EXIF") return "EXIF metadata";
    if (id == "XMP ") return "XMP metadata";
    return "Unknown chunk";
}

const char* yes_no(const bool b) { return b ? "yes" : "no"; }

void describe_content(const ContainerRecord& record, std::ostream& out) {
    const auto data = record.payload;
    if (record.id == "VP8X" && data.size() >= 10) {
        const std::uint8_t flags = data[0];
        const std::uint32_t width = (data[4] | (data[5] << 8) | (data[6] << 16)) + 1u;
        const std::uint32_t height = (data[7] | (data[8] << 8) | (data[9] << 16)) + 1u;
        out << "      Canvas: " << width << "x" << height << "\n";
        out << "      ICC: " << yes_no(flags & kIccFlag)
            << ", Alpha: " << yes_no(flags & kAlphaFlag)
            << ", EXIF: " << yes_no(flags & kExifFlag)
            << ", XMP: " << yes_no(flags & kXmpFlag)
            << ", Animation: " << yes_no(flags & kAnimationFlag) << "\n";
    } else if (record.id == "VP8 " && data.size() >= 10) {
        const std::uint32_t frame_tag = data[0] | (data[1] << 8) | (data[2] << 16);
        out << "      Key frame: " << yes_no((frame_tag & 1u) == 0)
            << ", Version: " << ((frame_tag >> 1) & 7u)
            << ", Show: " << yes_no(((frame_tag >> 4) & 1u) == 1) << "\n";
        if (data[3] == 0x9d && data[4] == 0x01 && data[5] == 0x2a) {
            const unsigned width = read_u16_le(data, 6) & 0x3fffu;
            const unsigned height = read_u16_le(data, 8) & 0x3fffu;
            out << "      Dimensions: " << width << "x" << height << "\n";
        }
    } else if (record.id == "VP8L" && data.size() >= 5 && data[0] == 0x2f) {
        const std::uint32_t bits = read_u32_le(data, 1);
        out << "      Dimensions: " << ((bits & 0x3fffu) + 1) << "x" << (((bits >> 14) & 0x3fffu) + 1)
            << ", Alpha: " << yes_no((bits >> 28) & 1u) << "\n";
    } else if (record.id == "EXIF" || record.id == "XMP " || record.id == "ICCP") {
        out << "      Contains " << describe_chunk(record.id) << " (" << data.size() << " bytes)\n";
    }
}

bool any_retained(const std::vector<const ContainerRecord*>& retained, const std::string_view id) {
    return std::ranges::any_of(retained, [&](const ContainerRecord* r) { return r->id == id; });
}

} // namespace

ChunkClass WebpEngine::classify(const std::string_view id) const noexcept {
    if (id == "VP8 " || id == "VP8L" || id == "ALPH") return ChunkClass::Essential;
    if (id == "VP8X" || id == "ANIM" || id == "ANMF") return ChunkClass::Safe;
    return ChunkClass::Unsafe;
}

void WebpEngine::append_chunk(std::vector<std::uint8_t>& out,
                              const ContainerRecord& record,
                              const std::vector<const ContainerRecord*>& retained) const {
    if (record.id == "ALPH" && !any_retained(retained, "VP8X")) {
        Logger::log(LogLevel::Warning, "ALPH kept without VP8X; decoders may ignore the alpha plane", name());
    }
    if (record.id != "VP8X" || record.payload.empty()) {
        write_chunk(out, record.id, record.payload);
        return;
    }

    std::vector<std::uint8_t> header(record.payload.begin(), record.payload.end());
    const std::uint8_t before = header[0];
    if (!any_retained(retained, "ICCP")) header[0] &= static_cast<std::uint8_t>(~kIccFlag);
    if (!any_retained(retained, "EXIF")) header[0] &= static_cast<std::uint8_t>(~kExifFlag);
    if (!any_retained(retained, "XMP ")) header[0] &= static_cast<std::uint8_t>(~kXmpFlag);
    if (header[0] != before) {
        Logger::log(LogLevel::Debug, "Cleared VP8X flags for dropped metadata chunks", name());
    }
    write_chunk(out, record.id, header);
}

void WebpEngine::inspect(const std::span<const std::uint8_t> input, std::ostream& out) const {
    write_banner(out, "WebP Metadata Inspection");
    out << "File size: " << input.size() << " bytes (" << format_size(input.size()) << ")\n";

    if (input.size() < 12 || !has_tag_at(input, 0, "RIFF") || !has_tag_at(input, 8, "WEBP")) {
        out << "Invalid WebP signature\n";
        write_footer(out);
        return;
    }
    out << "RIFF container size: " << read_u32_le(input, 4) << " bytes\n\n";

    std::vector<ContainerRecord> records;
    try {
        records = walk(input);
    } catch (const DecodeError& e) {
        out << "Chunk walk failed: " << e.what() << "\n";
        write_footer(out);
        return;
    }

    out << "WebP Chunks:\n";
    write_rule(out);

    std::size_t metadata_bytes = 0;
    for (const auto& record : records) {
        const ChunkClass cls = classify(record.id);
        const char* marker = cls == ChunkClass::Essential ? "[ESSENTIAL]"
                           : cls == ChunkClass::Safe      ? "[SAFE]"
                                                          : "[METADATA]";
        out << "  " << marker << " " << record.id << " - " << describe_chunk(record.id) << "\n";
        out << "      Size: " << record.byte_length << " bytes\n";
        describe_content(record, out);
        out << "\n";
        if (cls == ChunkClass::Unsafe) {
            metadata_bytes += 8 + record.byte_length + (record.byte_length & 1u);
        }
    }

    write_rule(out);
    out << "Summary: " << records.size() << " total chunks, " << format_size(metadata_bytes)
        << " of metadata chunks\n";
    write_footer(out);
}

} // namespace metascrub
