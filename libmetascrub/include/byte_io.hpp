/**
 * @file byte_io.hpp
 * @brief Bounds-checked integer reads and writes over byte buffers.
 *
 * Every multi-byte value is assembled byte by byte, so no alignment or
 * host endianness assumption is made about the source buffer.
 */

#ifndef METASCRUB_BYTE_IO_HPP
#define METASCRUB_BYTE_IO_HPP

#include "errors.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace metascrub {

/// Throws DecodeError unless [offset, offset + count) lies inside data.
inline void require_bytes(const std::span<const std::uint8_t> data,
                          const std::size_t offset,
                          const std::size_t count,
                          const char* what) {
    if (offset > data.size() || count > data.size() - offset) {
        throw DecodeError(std::string(what) + ": need " + std::to_string(count) +
                          " bytes at offset " + std::to_string(offset) +
                          ", buffer holds " + std::to_string(data.size()));
    }
}

[[nodiscard]] inline std::uint32_t read_u32_be(const std::span<const std::uint8_t> data,
                                               const std::size_t offset) {
    require_bytes(data, offset, 4, "read_u32_be");
    return (static_cast<std::uint32_t>(data[offset]) << 24) |
           (static_cast<std::uint32_t>(data[offset + 1]) << 16) |
           (static_cast<std::uint32_t>(data[offset + 2]) << 8) |
           static_cast<std::uint32_t>(data[offset + 3]);
}

[[nodiscard]] inline std::uint32_t read_u32_le(const std::span<const std::uint8_t> data,
                                               const std::size_t offset) {
    require_bytes(data, offset, 4, "read_u32_le");
    return static_cast<std::uint32_t>(data[offset]) |
           (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

[[nodiscard]] inline std::uint16_t read_u16_le(const std::span<const std::uint8_t> data,
                                               const std::size_t offset) {
    require_bytes(data, offset, 2, "read_u16_le");
    return static_cast<std::uint16_t>(data[offset] | (data[offset + 1] << 8));
}

[[nodiscard]] inline std::uint16_t read_u16_be(const std::span<const std::uint8_t> data,
                                               const std::size_t offset) {
    require_bytes(data, offset, 2, "read_u16_be");
    return static_cast<std::uint16_t>((data[offset] << 8) | data[offset + 1]);
}

inline void append_u32_be(std::vector<std::uint8_t>& out, const std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

inline void append_u32_le(std::vector<std::uint8_t>& out, const std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 24));
}

/// Overwrites four bytes at offset with v in little-endian order.
inline void patch_u32_le(std::vector<std::uint8_t>& out, const std::size_t offset, const std::uint32_t v) {
    require_bytes(out, offset, 4, "patch_u32_le");
    out[offset]     = static_cast<std::uint8_t>(v);
    out[offset + 1] = static_cast<std::uint8_t>(v >> 8);
    out[offset + 2] = static_cast<std::uint8_t>(v >> 16);
    out[offset + 3] = static_cast<std::uint8_t>(v >> 24);
}

inline void append_bytes(std::vector<std::uint8_t>& out, const std::span<const std::uint8_t> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void append_tag(std::vector<std::uint8_t>& out, const std::string_view tag) {
    out.insert(out.end(), tag.begin(), tag.end());
}

/// @return True if data holds tag at offset.
[[nodiscard]] inline bool has_tag_at(const std::span<const std::uint8_t> data,
                                     const std::size_t offset,
                                     const std::string_view tag) {
    if (offset > data.size() || tag.size() > data.size() - offset) return false;
    for (std::size_t i = 0; i < tag.size(); ++i) {
        if (data[offset + i] != static_cast<std::uint8_t>(tag[i])) return false;
    }
    return true;
}

/// Views four bytes of data as an ASCII tag. The bytes must outlive the view.
[[nodiscard]] inline std::string_view tag_view(const std::span<const std::uint8_t> data,
                                               const std::size_t offset) {
    require_bytes(data, offset, 4, "tag_view");
    return {reinterpret_cast<const char*>(data.data() + offset), 4};
}

/**
 * @brief Largest value a synchsafe integer can carry (2^28 - 1).
 */
inline constexpr std::uint32_t kMaxSynchsafe = 0x0FFFFFFFu;

/**
 * @brief Decodes an ID3v2 synchsafe integer.
 *
 * Only the low seven bits of each of the four bytes carry data.
 */
[[nodiscard]] inline std::uint32_t decode_synchsafe(const std::span<const std::uint8_t> data,
                                                    const std::size_t offset) {
    require_bytes(data, offset, 4, "decode_synchsafe");
    return (static_cast<std::uint32_t>(data[offset] & 0x7F) << 21) |
           (static_cast<std::uint32_t>(data[offset + 1] & 0x7F) << 14) |
           (static_cast<std::uint32_t>(data[offset + 2] & 0x7F) << 7) |
           static_cast<std::uint32_t>(data[offset + 3] & 0x7F);
}

/**
 * @brief Appends v as a four-byte synchsafe integer.
 * @throws std::out_of_range if v exceeds kMaxSynchsafe.
 */
inline void append_synchsafe(std::vector<std::uint8_t>& out, const std::uint32_t v) {
    if (v > kMaxSynchsafe) {
        throw std::out_of_range("synchsafe value out of range: " + std::to_string(v));
    }
    out.push_back(static_cast<std::uint8_t>((v >> 21) & 0x7F));
    out.push_back(static_cast<std::uint8_t>((v >> 14) & 0x7F));
    out.push_back(static_cast<std::uint8_t>((v >> 7) & 0x7F));
    out.push_back(static_cast<std::uint8_t>(v & 0x7F));
}

} // namespace metascrub

#endif // METASCRUB_BYTE_IO_HPP
