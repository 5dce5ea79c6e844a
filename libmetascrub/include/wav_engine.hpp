/**
 * @file wav_engine.hpp
 * @brief Container engine for WAV (RIFF/WAVE) files.
 */

#ifndef METASCRUB_WAV_ENGINE_HPP
#define METASCRUB_WAV_ENGINE_HPP

#include "riff_engine.hpp"

namespace metascrub {

/**
 * @brief Strips broadcast, iXML, ID3 and padding chunks from WAV files.
 *
 * `fmt `, `data` and `fact` are essential and survive every policy.
 * `LIST`, `cue `, `smpl` and `inst` are kept under Safe. Everything else
 * is dropped under both All and Safe.
 *
 * Unlike the other engines, a final chunk whose declared size runs past
 * the end of the file is clamped to the available bytes instead of
 * failing the walk.
 */
class WavEngine final : public RiffEngine {
public:
    WavEngine() noexcept : RiffEngine("WAVE", true) {}

    [[nodiscard]] std::string_view name() const noexcept override { return "wav"; }

    [[nodiscard]] ChunkClass classify(std::string_view id) const noexcept override;

    void inspect(std::span<const std::uint8_t> input, std::ostream& out) const override;
};

/**
 * @brief Human-readable name of a WAVE format tag (1 = PCM, 3 = IEEE Float, ...).
 */
const char* wave_format_name(std::uint16_t format_tag);

} // namespace metascrub

#endif // METASCRUB_WAV_ENGINE_HPP
