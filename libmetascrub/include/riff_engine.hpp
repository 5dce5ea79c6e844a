/**
 * @file riff_engine.hpp
 * @brief Shared RIFF chunk walker and reconstructor for WebP and WAV.
 */

#ifndef METASCRUB_RIFF_ENGINE_HPP
#define METASCRUB_RIFF_ENGINE_HPP

#include "container_engine.hpp"
#include <string_view>

namespace metascrub {

/**
 * @brief Base engine for `RIFF | u32le size | form | chunks` containers.
 *
 * @details Chunks are `4cc | u32le size | payload` followed by one zero
 * byte when size is odd. The padding byte is never copied; the
 * reconstructor regenerates it. After reconstruction the RIFF size field
 * is patched to the output length minus the 8-byte RIFF header.
 *
 * Subclasses supply the form type, the vocabulary (classify) and the
 * inspection dump.
 */
class RiffEngine : public ContainerEngine {
public:
    [[nodiscard]] std::vector<ContainerRecord> walk(std::span<const std::uint8_t> input) const override;

    [[nodiscard]] std::vector<std::uint8_t> reconstruct(std::span<const std::uint8_t> input,
                                                        const std::vector<ContainerRecord>& records,
                                                        StripPolicy policy) const override;

protected:
    /**
     * @param form_type Four-character form type expected at offset 8.
     * @param tolerate_truncation If true, a final chunk whose declared size
     * runs past the end of the buffer is clamped to the available bytes and
     * the walk stops there. Otherwise such a chunk is a DecodeError.
     */
    RiffEngine(std::string_view form_type, bool tolerate_truncation) noexcept
        : form_type_(form_type), tolerate_truncation_(tolerate_truncation) {}

    /**
     * @brief Appends one retained chunk to out.
     *
     * The default writes the chunk unchanged. Overrides may rewrite the
     * payload of a chunk whose content describes other chunks.
     *
     * @param retained Every chunk that survives the policy, in order.
     */
    virtual void append_chunk(std::vector<std::uint8_t>& out,
                              const ContainerRecord& record,
                              const std::vector<const ContainerRecord*>& retained) const;

    /// Writes `id | u32le payload.size() | payload | pad` to out.
    static void write_chunk(std::vector<std::uint8_t>& out,
                            std::string_view id,
                            std::span<const std::uint8_t> payload);

private:
    std::string_view form_type_;
    bool tolerate_truncation_;
};

} // namespace metascrub

#endif // METASCRUB_RIFF_ENGINE_HPP
