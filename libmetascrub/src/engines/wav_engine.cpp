#include "../../include/wav_engine.hpp"
#include "../../include/byte_io.hpp"
#include "../../include/inspect_util.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>

namespace metascrub {

namespace {

const char* describe_chunk(const std::string_view id) {
    if (id == "fmt ") return "Format";
    if (id == "data") return "Audio Data";
    if (id == "fact") return "Fact (sample count)";
    if (id == "LIST") return "List Container";
    if (id == "cue ") return "Cue Points";
    if (id == "smpl") return "Sampler Info";
    if (id == "inst") return "Instrument";
    if (id == "bext") return "Broadcast Extension (BWF)";
    if (id == "iXML") return "iXML Metadata";
    if (id == "JUNK" || id == "junk") return "Padding/Junk";
    if (id == "PAD " || id == "pad ") return "Padding";
    if (id == "PEAK") return "Peak Envelope";
    if (id == "DISP") return "Display/Title";
    if (id == "acid") return "Acid Loop Info";
    if (id == "strc") return "Structure";
    if (id == "afsp") return "AFsp Info";
    if (id == "cart") return "Cart Chunk (AES46)";
    if (id == "labl") return "Label";
    if (id == "note") return "Note";
    if (id == "ltxt") return "Labeled Text";
    if (id == "plst") return "Playlist";
    if (id == "ID3 " || id == "id3 ") return "ID3 Tag";
    return "Unknown";
}

const char* describe_info_field(const std::string_view id) {
    if (id == "IART") return "Artist";
    if (id == "INAM") return "Title";
    if (id == "IPRD") return "Product/Album";
    if (id == "ICMT") return "Comment";
    if (id == "ICRD") return "Creation Date";
    if (id == "IGNR") return "Genre";
    if (id == "ISFT") return "Software";
    if (id == "ITRK") return "Track Number";
    if (id == "ICOP") return "Copyright";
    if (id == "IENG") return "Engineer";
    if (id == "ITCH") return "Technician";
    if (id == "ISRC") return "Source";
    return nullptr;
}

// LIST/INFO sub-chunks share the RIFF chunk grammar; a short final entry is clamped.
void write_info_entries(const std::span<const std::uint8_t> data, std::ostream& out) {
    std::size_t pos = 0;
    while (pos + 8 <= data.size()) {
        const std::string_view id = tag_view(data, pos);
        const std::uint32_t size = read_u32_le(data, pos + 4);
        const std::size_t end = std::min<std::size_t>(pos + 8 + static_cast<std::size_t>(size), data.size());

        const std::string value = trim_fixed_field(data.subspan(pos + 8, end - pos - 8));
        if (!value.empty()) {
            const char* label = describe_info_field(id);
            out << "      " << (label ? std::string_view(label) : id) << ": " << value << "\n";
        }

        pos = end;
        if ((pos & 1u) != 0) ++pos;
    }
}

void write_format_summary(const ContainerRecord& fmt, const std::vector<ContainerRecord>& records, std::ostream& out) {
    const auto data = fmt.payload;
    const std::uint16_t format_tag = read_u16_le(data, 0);
    const std::uint16_t channels = read_u16_le(data, 2);
    const std::uint32_t sample_rate = read_u32_le(data, 4);
    const std::uint32_t byte_rate = read_u32_le(data, 8);
    const std::uint16_t bits_per_sample = read_u16_le(data, 14);

    out << "Audio Format: " << wave_format_name(format_tag) << " (" << format_tag << ")\n";
    out << "Channels: " << channels << "\n";
    out << "Sample Rate: " << sample_rate << " Hz\n";
    out << "Byte Rate: " << byte_rate << " bytes/sec\n";
    out << "Bits Per Sample: " << bits_per_sample << "\n";
    out << "Bitrate: " << (static_cast<std::uint64_t>(byte_rate) * 8 / 1000) << " kbps\n";

    const auto data_chunk = std::ranges::find_if(records, [](const ContainerRecord& r) { return r.id == "data"; });
    if (data_chunk != records.end()) {
        if (byte_rate > 0) {
            const double seconds = static_cast<double>(data_chunk->byte_length) / byte_rate;
            const auto minutes = static_cast<std::uint64_t>(seconds) / 60;
            const double rest = seconds - static_cast<double>(minutes * 60);
            out << "Duration: " << minutes << ":" << std::setw(5) << std::setfill('0') << std::fixed
                << std::setprecision(2) << rest << std::setfill(' ') << "\n";
        }
        out << "Audio Data Size: " << data_chunk->byte_length << " bytes ("
            << format_size(data_chunk->byte_length) << ")\n";
    }
    out << "\n";
}

} // namespace

const char* wave_format_name(const std::uint16_t format_tag) {
    switch (format_tag) {
        case 0x0001: return "PCM (uncompressed)";
        case 0x0003: return "IEEE Float";
        case 0x0006: return "A-law";
        case 0x0007: return "mu-law";
        case 0xFFFE: return "Extensible";
        default:     return "Unknown";
    }
}

ChunkClass WavEngine::classify(const std::string_view id) const noexcept {
    if (id == "fmt " || id == "data" || id == "fact") return ChunkClass::Essential;
    if (id == "LIST" || id == "cue " || id == "smpl" || id == "inst") return ChunkClass::Safe;
    return ChunkClass::Unsafe;
}

void WavEngine::inspect(const std::span<const std::uint8_t> input, std::ostream& out) const {
    write_banner(out, "WAV Metadata Inspection");
    out << "File size: " << input.size() << " bytes (" << format_size(input.size()) << ")\n\n";

    std::vector<ContainerRecord> records;
    try {
        records = walk(input);
    } catch (const DecodeError& e) {
        out << "Invalid WAV file: " << e.what() << "\n";
        write_footer(out);
        return;
    }

    const auto fmt = std::ranges::find_if(records, [](const ContainerRecord& r) {
        return r.id == "fmt " && r.byte_length >= 16;
    });
    if (fmt != records.end()) {
        write_format_summary(*fmt, records, out);
    }

    out << "RIFF Chunks:\n";
    write_rule(out);

    std::size_t strippable_all = 0;
    std::size_t strippable_safe = 0;
    for (const auto& record : records) {
        const ChunkClass cls = classify(record.id);
        const char* marker = cls == ChunkClass::Essential ? "[ESSENTIAL]"
                           : cls == ChunkClass::Safe      ? "[SAFE]"
                                                          : "[METADATA]";
        out << "  " << marker << " " << record.id << " - " << describe_chunk(record.id) << "\n";
        out << "      Size: " << record.byte_length << " bytes\n";

        if (record.id == "LIST" && record.byte_length >= 4) {
            const std::string_view list_type = tag_view(record.payload, 0);
            out << "      List type: " << list_type << "\n";
            if (list_type == "INFO") {
                write_info_entries(record.payload.subspan(4), out);
            }
        }
        out << "\n";

        const std::size_t footprint = 8 + record.byte_length + (record.byte_length & 1u);
        if (cls != ChunkClass::Essential) strippable_all += footprint;
        if (cls == ChunkClass::Unsafe) strippable_safe += footprint;
    }

    write_rule(out);
    out << "Summary: " << records.size() << " chunks, " << strippable_all
        << " bytes strippable (all), " << strippable_safe << " bytes strippable (safe)\n";
    write_footer(out);
}

} // namespace metascrub
