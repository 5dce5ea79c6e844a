/**
 * @file webp_engine.hpp
 * @brief Container engine for WebP (RIFF/WEBP) files.
 */

#ifndef METASCRUB_WEBP_ENGINE_HPP
#define METASCRUB_WEBP_ENGINE_HPP

#include "riff_engine.hpp"

namespace metascrub {

/**
 * @brief Strips ICCP, EXIF, XMP and unknown chunks from WebP files.
 *
 * | Class     | Chunks                 |
 * |-----------|------------------------|
 * | Essential | `VP8 `, `VP8L`, `ALPH` |
 * | Safe      | `VP8X`, `ANIM`, `ANMF` |
 * | Unsafe    | everything else        |
 *
 * A retained VP8X header has its ICC, EXIF and XMP flags cleared when the
 * chunk it announces was dropped.
 */
class WebpEngine final : public RiffEngine {
public:
    WebpEngine() noexcept : RiffEngine("WEBP", false) {}

    [[nodiscard]] std::string_view name() const noexcept override { return "webp"; }

    [[nodiscard]] ChunkClass classify(std::string_view id) const noexcept override;

    void inspect(std::span<const std::uint8_t> input, std::ostream& out) const override;

protected:
    void append_chunk(std::vector<std::uint8_t>& out,
                      const ContainerRecord& record,
                      const std::vector<const ContainerRecord*>& retained) const override;
};

} // namespace metascrub

#endif // METASCRUB_WEBP_ENGINE_HPP
