#include "../../include/id3_engine.hpp"
#include "../../include/byte_io.hpp"
#include "../../include/id3_tag_model.hpp"
#include "../../include/inspect_util.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <ostream>

namespace metascrub {

namespace {

constexpr std::array<std::string_view, 7> kSafeFrames = {
    "TIT2", "TPE1", "TALB", "TYER", "TDRC", "TCON", "TRCK"
};

constexpr std::array<const char*, 42> kGenres = {
    "Blues", "Classic Rock", "Country", "Dance", "Disco", "Funk", "Grunge",
    "Hip-Hop", "Jazz", "Metal", "New Age", "Oldies", "Other", "Pop", "R&B",
    "Rap", "Reggae", "Rock", "Techno", "Industrial", "Alternative", "Ska",
    "Death Metal", "Pranks", "Soundtrack", "Euro-Techno", "Ambient",
    "Trip-Hop", "Vocal", "Jazz+Funk", "Fusion", "Trance", "Classical",
    "Instrumental", "Acid", "House", "Game", "Sound Clip", "Gospel", "Noise",
    "AlternRock", "Bass"
};

const ContainerRecord* find_record(const std::vector<ContainerRecord>& records, const std::string_view id) {
    const auto it = std::ranges::find_if(records, [&](const ContainerRecord& r) { return r.id == id; });
    return it == records.end() ? nullptr : &*it;
}

std::string or_empty(const std::string& s) {
    return s.empty() ? "(empty)" : s;
}

void write_id3v1(const Id3v1Tag& tag, std::ostream& out) {
    out << "  Title:   " << or_empty(tag.title) << "\n";
    out << "  Artist:  " << or_empty(tag.artist) << "\n";
    out << "  Album:   " << or_empty(tag.album) << "\n";
    out << "  Year:    " << or_empty(tag.year) << "\n";
    out << "  Comment: " << or_empty(tag.comment) << "\n";
    out << "  Genre:   " << static_cast<int>(tag.genre) << " (" << id3v1_genre_name(tag.genre) << ")\n";
}

} // namespace

std::size_t id3v2_span(const std::span<const std::uint8_t> input) {
    if (input.size() < kId3v2HeaderSize || !has_tag_at(input, 0, "ID3")) {
        return 0;
    }
    return decode_synchsafe(input, 6) + kId3v2HeaderSize;
}

bool has_id3v1(const std::span<const std::uint8_t> input) {
    return input.size() >= kId3v1Size && has_tag_at(input, input.size() - kId3v1Size, "TAG");
}

std::optional<Id3v1Tag> read_id3v1(const std::span<const std::uint8_t> input) {
    if (!has_id3v1(input)) return std::nullopt;
    const auto tag = input.last(kId3v1Size);
    Id3v1Tag result;
    result.title = trim_fixed_field(tag.subspan(3, 30));
    result.artist = trim_fixed_field(tag.subspan(33, 30));
    result.album = trim_fixed_field(tag.subspan(63, 30));
    result.year = trim_fixed_field(tag.subspan(93, 4));
    result.comment = trim_fixed_field(tag.subspan(97, 30));
    result.genre = tag[127];
    return result;
}

const char* id3v1_genre_name(const std::uint8_t code) {
    return code < kGenres.size() ? kGenres[code] : "Unknown";
}

const char* id3_frame_name(const std::string_view frame_id) {
    if (frame_id == "TIT2") return "Title";
    if (frame_id == "TPE1") return "Artist";
    if (frame_id == "TALB") return "Album";
    if (frame_id == "TYER") return "Year";
    if (frame_id == "TDRC") return "Recording Time";
    if (frame_id == "TCON") return "Genre";
    if (frame_id == "TRCK") return "Track Number";
    if (frame_id == "TPOS") return "Part Of Set";
    if (frame_id == "COMM") return "Comment";
    if (frame_id == "APIC") return "Attached Picture";
    if (frame_id == "USLT") return "Unsynchronized Lyrics";
    if (frame_id == "TXXX") return "User Defined Text";
    if (frame_id == "WXXX") return "User Defined URL";
    if (frame_id == "PRIV") return "Private Data";
    if (frame_id == "POPM") return "Popularimeter";
    if (frame_id == "TBPM") return "BPM";
    if (frame_id == "TCOM") return "Composer";
    if (frame_id == "TLEN") return "Length";
    if (frame_id == "TPUB") return "Publisher";
    if (frame_id == "TPE2") return "Band/Orchestra/Accompaniment";
    if (frame_id == "TPE3") return "Conductor";
    if (frame_id == "TPE4") return "Interpreted/Remixed By";
    if (frame_id == "TEXT") return "Lyricist";
    if (frame_id == "TCOP") return "Copyright";
    if (frame_id == "TENC") return "Encoded By";
    if (frame_id == "TSRC") return "ISRC";
    return "Unknown Frame";
}

std::vector<ContainerRecord> Id3Engine::walk(const std::span<const std::uint8_t> input) const {
    const std::size_t v2_end = id3v2_span(input);
    const bool v1 = has_id3v1(input);
    const std::size_t audio_end = v1 ? input.size() - kId3v1Size : input.size();

    std::vector<ContainerRecord> records;
    if (v2_end > 0) {
        const std::size_t available = std::min(v2_end, input.size());
        records.push_back({kId3v2Record, input.first(available), static_cast<std::uint32_t>(available), 0, 0});
    }
    if (v2_end < audio_end) {
        records.push_back({kAudioRecord, input.subspan(v2_end, audio_end - v2_end),
                           static_cast<std::uint32_t>(audio_end - v2_end), v2_end, 0});
    }
    if (v1) {
        records.push_back({kId3v1Record, input.last(kId3v1Size), static_cast<std::uint32_t>(kId3v1Size),
                           input.size() - kId3v1Size, 0});
    }
    return records;
}

ChunkClass Id3Engine::classify(const std::string_view id) const noexcept {
    if (id == kAudioRecord) return ChunkClass::Essential;
    if (std::ranges::find(kSafeFrames, id) != kSafeFrames.end()) return ChunkClass::Safe;
    return ChunkClass::Unsafe;
}

std::vector<std::uint8_t> Id3Engine::reconstruct(const std::span<const std::uint8_t> input,
                                                 const std::vector<ContainerRecord>& records,
                                                 const StripPolicy policy) const {
    const ContainerRecord* v2 = find_record(records, kId3v2Record);
    const ContainerRecord* audio = find_record(records, kAudioRecord);
    const ContainerRecord* v1 = find_record(records, kId3v1Record);

    if (policy == StripPolicy::All) {
        if (!audio) {
            throw DecodeError("Invalid MP3 structure: no audio data found");
        }
        if (v2) Logger::log(LogLevel::Debug, "Removing ID3v2 (" + std::to_string(v2->byte_length) + " bytes)", name());
        if (v1) Logger::log(LogLevel::Debug, "Removing ID3v1 (128 bytes)", name());
        return {audio->payload.begin(), audio->payload.end()};
    }

    std::unique_ptr<Id3TagModel> model;
    if (v2 && id3v2_span(input) <= input.size()) {
        model = Id3TagModel::parse(v2->payload);
    }

    if (!model) {
        if (v1) {
            Logger::log(LogLevel::Info, "No parsable ID3v2 tag, removing ID3v1 only", name());
            return {input.begin(), input.end() - static_cast<std::ptrdiff_t>(kId3v1Size)};
        }
        Logger::log(LogLevel::Debug, "No ID3 tags found", name());
        return {input.begin(), input.end()};
    }

    const std::size_t total = model->frame_count();
    const std::size_t removed = model->retain_frames([this](const std::string_view id) {
        return classify(id) == ChunkClass::Safe;
    });
    Logger::log(LogLevel::Info,
                "ID3v2." + std::to_string(model->major_version()) + ": keeping " + std::to_string(total - removed) +
                " safe frames, removing " + std::to_string(removed) + " unsafe frames",
                name());

    if (removed == 0 && !v1) {
        return {input.begin(), input.end()};
    }
    if (!audio) {
        throw DecodeError("Invalid MP3 structure: no audio data found");
    }

    std::vector<std::uint8_t> out;
    if (model->frame_count() > 0) {
        out = model->render_v24();
    } else {
        Logger::log(LogLevel::Debug, "No safe frames left, dropping the ID3v2 tag", name());
    }
    append_bytes(out, audio->payload);
    return out;
}

void Id3Engine::inspect(const std::span<const std::uint8_t> input, std::ostream& out) const {
    write_banner(out, "MP3 Metadata Inspection");
    out << "File size: " << input.size() << " bytes (" << format_size(input.size()) << ")\n";

    const auto records = walk(input);
    const ContainerRecord* v2 = find_record(records, kId3v2Record);
    const ContainerRecord* audio = find_record(records, kAudioRecord);
    const auto v1 = read_id3v1(input);

    if (v2) {
        out << "ID3v2 tag: " << id3v2_span(input) << " bytes (" << format_size(id3v2_span(input)) << ")";
        if (id3v2_span(input) > input.size()) out << " [truncated]";
        out << "\n";
    } else {
        out << "ID3v2 tag: Not found\n";
    }
    out << "ID3v1 tag: " << (v1 ? "Present (128 bytes)" : "Not found") << "\n";
    const std::size_t audio_size = audio ? audio->byte_length : 0;
    out << "Audio data: " << audio_size << " bytes (" << format_size(audio_size) << ")\n\n";

    std::unique_ptr<Id3TagModel> model;
    if (v2 && id3v2_span(input) <= input.size()) {
        model = Id3TagModel::parse(v2->payload);
    }

    if (model) {
        out << "ID3v2." << model->major_version() << " Tag Contents:\n";
        write_rule(out);
        const auto frames = model->frames();
        if (frames.empty()) {
            out << "  (no frames found)\n";
        } else {
            out << "  Total frames: " << frames.size() << "\n\n";
            std::size_t safe_count = 0;
            for (const auto& frame : frames) {
                const bool safe = classify(frame.id) == ChunkClass::Safe;
                if (safe) ++safe_count;
                out << "  " << (safe ? "[SAFE]" : "[UNSAFE]") << " " << id3_frame_name(frame.id) << "\n";
                out << "      ID: " << frame.id << "\n";
                if (frame.is_private) {
                    out << "      Owner: " << frame.owner << "\n";
                    out << "      Data: " << format_unknown_data(frame.private_data) << "\n";
                    const auto paths = extract_file_paths(frame.private_data);
                    if (!paths.empty()) {
                        out << "      Found " << paths.size() << " file path(s):\n";
                        for (const auto& path : paths) {
                            out << "        - " << path << "\n";
                        }
                    }
                } else {
                    out << "      Value: " << frame.value << "\n";
                }
                out << "\n";
            }
            write_rule(out);
            out << "Summary: " << safe_count << " safe frames, " << frames.size() - safe_count << " unsafe frames\n";
        }
    } else if (v2) {
        out << "Could not parse ID3v2 tag\n";
    } else {
        out << "No ID3v2 tag found\n";
    }

    if (v1) {
        out << "\nID3v1 Tag Contents:\n";
        write_rule(out);
        write_id3v1(*v1, out);
    }
    write_footer(out);
}

} // namespace metascrub
