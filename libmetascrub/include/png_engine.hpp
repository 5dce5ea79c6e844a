/**
 * @file png_engine.hpp
 * @brief Container engine for PNG files.
 */

#ifndef METASCRUB_PNG_ENGINE_HPP
#define METASCRUB_PNG_ENGINE_HPP

#include "container_engine.hpp"
#include <array>

namespace metascrub {

/// The 8-byte PNG file signature.
inline constexpr std::array<std::uint8_t, 8> kPngSignature = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

/**
 * @brief Strips textual, time, EXIF and unknown ancillary chunks from PNG files.
 *
 * @details A chunk is critical (Essential) iff bit 0x20 of the first type
 * byte is clear. The ancillary chunks needed for correct colour
 * interpretation (`tRNS`, `gAMA`, `cHRM`, `sRGB`, `sBIT`, `pHYs`) are Safe;
 * every other ancillary chunk is Unsafe.
 *
 * All and Safe retain the same set: critical plus Safe chunks. Retained
 * chunks are re-emitted verbatim, CRC included. The walk ends at IEND;
 * bytes after it are not carried over.
 */
class PngEngine final : public ContainerEngine {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "png"; }

    [[nodiscard]] std::vector<ContainerRecord> walk(std::span<const std::uint8_t> input) const override;

    [[nodiscard]] ChunkClass classify(std::string_view id) const noexcept override;

    [[nodiscard]] bool retains(ChunkClass cls, StripPolicy policy) const noexcept override;

    [[nodiscard]] std::vector<std::uint8_t> reconstruct(std::span<const std::uint8_t> input,
                                                        const std::vector<ContainerRecord>& records,
                                                        StripPolicy policy) const override;

    void inspect(std::span<const std::uint8_t> input, std::ostream& out) const override;
};

/// @return True if input starts with the PNG signature.
[[nodiscard]] bool has_png_signature(std::span<const std::uint8_t> input) noexcept;

} // namespace metascrub

#endif // METASCRUB_PNG_ENGINE_HPP
