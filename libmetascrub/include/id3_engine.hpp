/**
 * @file id3_engine.hpp
 * @brief Container engine for MP3 files carrying ID3v1 and ID3v2 tags.
 */

#ifndef METASCRUB_ID3_ENGINE_HPP
#define METASCRUB_ID3_ENGINE_HPP

#include "container_engine.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace metascrub {

/// Size of the fixed ID3v1 trailer.
inline constexpr std::size_t kId3v1Size = 128;
/// Size of the ID3v2 header.
inline constexpr std::size_t kId3v2HeaderSize = 10;

/**
 * @brief Decoded ID3v1 trailer fields, trimmed of trailing NUL and space.
 */
struct Id3v1Tag {
    std::string title;
    std::string artist;
    std::string album;
    std::string year;
    std::string comment;
    std::uint8_t genre = 0xFF;
};

/**
 * @brief Strips ID3 tags from MP3 files.
 *
 * @details walk() does not descend into the ID3v2 frames. It splits the
 * file into up to three layout records: the ID3v2 tag ("ID3 "), the audio
 * between the tags ("MPEG") and the ID3v1 trailer ("TAG "). Frames are
 * parsed through Id3TagModel only when the Safe policy needs them.
 *
 * - All: only the audio survives. An empty or inverted audio span is a
 *   DecodeError.
 * - Safe: the ID3v2 tag is rebuilt as ID3v2.4 with only the frames
 *   `TIT2 TPE1 TALB TYER TDRC TCON TRCK`, in their original order, and the
 *   ID3v1 trailer is dropped. An input with nothing to remove is returned
 *   byte for byte.
 */
class Id3Engine final : public ContainerEngine {
public:
    /// Identifier of the audio layout record.
    static constexpr std::string_view kAudioRecord = "MPEG";
    /// Identifier of the ID3v2 layout record.
    static constexpr std::string_view kId3v2Record = "ID3 ";
    /// Identifier of the ID3v1 layout record.
    static constexpr std::string_view kId3v1Record = "TAG ";

    [[nodiscard]] std::string_view name() const noexcept override { return "mp3"; }

    [[nodiscard]] std::vector<ContainerRecord> walk(std::span<const std::uint8_t> input) const override;

    /// Classifies layout records and ID3v2 frame IDs alike.
    [[nodiscard]] ChunkClass classify(std::string_view id) const noexcept override;

    [[nodiscard]] std::vector<std::uint8_t> reconstruct(std::span<const std::uint8_t> input,
                                                        const std::vector<ContainerRecord>& records,
                                                        StripPolicy policy) const override;

    void inspect(std::span<const std::uint8_t> input, std::ostream& out) const override;
};

/**
 * @brief Total ID3v2 span (header plus synchsafe size) at offset 0.
 * @return 0 if input does not start with an ID3v2 header. The span may
 * exceed input.size() for a truncated tag.
 */
[[nodiscard]] std::size_t id3v2_span(std::span<const std::uint8_t> input);

/// @return True if the last 128 bytes of input begin with "TAG".
[[nodiscard]] bool has_id3v1(std::span<const std::uint8_t> input);

/// Decodes the ID3v1 trailer, if any.
[[nodiscard]] std::optional<Id3v1Tag> read_id3v1(std::span<const std::uint8_t> input);

/// @return Name of an ID3v1 genre code, "Unknown" past the standard list.
const char* id3v1_genre_name(std::uint8_t code);

/// @return Readable name of an ID3v2 frame ID ("TIT2" -> "Title").
const char* id3_frame_name(std::string_view frame_id);

} // namespace metascrub

#endif // METASCRUB_ID3_ENGINE_HPP
