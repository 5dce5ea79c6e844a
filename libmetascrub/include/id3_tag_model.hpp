/**
 * @file id3_tag_model.hpp
 * @brief ID3v2 frame model backed by TagLib.
 *
 * The ID3 engine owns frame classification and the byte layout around
 * the tag; the frame binary layout itself (unsynchronisation, extended
 * headers, per-version frame headers) is left to TagLib.
 */

#ifndef METASCRUB_ID3_TAG_MODEL_HPP
#define METASCRUB_ID3_TAG_MODEL_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace metascrub {

/**
 * @brief One decoded ID3v2 frame, as shown by the inspector.
 */
struct Id3Frame {
    std::string id;                         ///< Four-character frame ID (e.g. "TIT2")
    std::string value;                      ///< Display text for the frame content
    bool is_private = false;                ///< True for PRIV frames
    std::string owner;                      ///< PRIV owner identifier
    std::vector<std::uint8_t> private_data; ///< PRIV payload
};

/**
 * @brief Parsed ID3v2 tag.
 *
 * Instances are created by parse() and own a private copy of the tag
 * bytes, so the source buffer may be released afterwards.
 */
class Id3TagModel {
public:
    ~Id3TagModel();
    Id3TagModel(Id3TagModel&&) noexcept;
    Id3TagModel& operator=(Id3TagModel&&) noexcept;

    /**
     * @brief Parses the ID3v2 tag at the start of tag_bytes.
     * @param tag_bytes At least the complete tag (header included).
     * @return The parsed tag, or nullptr if TagLib finds no valid tag.
     */
    static std::unique_ptr<Id3TagModel> parse(std::span<const std::uint8_t> tag_bytes);

    /// @return Major version of the parsed tag (2, 3 or 4).
    [[nodiscard]] unsigned major_version() const;

    /// @return Frames in tag order.
    [[nodiscard]] std::vector<Id3Frame> frames() const;

    /**
     * @brief Removes every frame whose ID keep rejects.
     * @return Number of frames removed.
     */
    std::size_t retain_frames(const std::function<bool(std::string_view)>& keep);

    /// @return Number of frames currently in the tag.
    [[nodiscard]] std::size_t frame_count() const;

    /**
     * @brief Serialises the tag in ID3v2.4 wire format.
     *
     * Frame content and relative order are preserved.
     *
     * @return The rendered tag (header, frames and TagLib's padding).
     * @throws EncodeError if TagLib renders nothing.
     */
    [[nodiscard]] std::vector<std::uint8_t> render_v24() const;

private:
    struct Impl;
    explicit Id3TagModel(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace metascrub

#endif // METASCRUB_ID3_TAG_MODEL_HPP
