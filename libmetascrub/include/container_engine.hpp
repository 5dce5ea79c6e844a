/**
 * @file container_engine.hpp
 * @brief Defines the interface shared by the four container engines.
 *
 * An engine owns one container grammar. It walks the input into an
 * ordered sequence of ContainerRecord, classifies each record by
 * sensitivity and rebuilds a container from the records a StripPolicy
 * retains. The same walk backs a read-only inspection dump.
 */

#ifndef METASCRUB_CONTAINER_ENGINE_HPP
#define METASCRUB_CONTAINER_ENGINE_HPP

#include "container_record.hpp"
#include "strip_policy.hpp"
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string_view>
#include <vector>

namespace metascrub {

/**
 * @brief Walk, classify and reconstruct one container format.
 *
 * @details Engines are stateless: every call builds its record set from
 * the buffer it is given and discards it on return, so a single engine
 * instance may be shared by any number of worker threads.
 */
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    /// @return Short format name used as log tag (e.g. "png").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Linearly scans input into records.
     * @param input The whole file.
     * @return Records in file order; views into input.
     * @throws DecodeError if the signature is wrong or a length overruns input.
     */
    [[nodiscard]] virtual std::vector<ContainerRecord> walk(std::span<const std::uint8_t> input) const = 0;

    /// Maps a record identifier to its sensitivity class.
    [[nodiscard]] virtual ChunkClass classify(std::string_view id) const noexcept = 0;

    /**
     * @brief Decides whether a record of class cls survives policy.
     *
     * The default keeps only Essential records under All and everything
     * but Unsafe records under Safe.
     */
    [[nodiscard]] virtual bool retains(ChunkClass cls, StripPolicy policy) const noexcept;

    /**
     * @brief Builds a new container from the records policy retains.
     * @param input The buffer the records were walked from.
     * @param records Output of walk(input).
     * @param policy All or Safe.
     * @return The rebuilt container with corrected size fields.
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> reconstruct(std::span<const std::uint8_t> input,
                                                                const std::vector<ContainerRecord>& records,
                                                                StripPolicy policy) const = 0;

    /**
     * @brief Writes a human-readable dump of the container to out.
     *
     * Never throws on malformed input; what could not be walked is
     * reported as a diagnostic line.
     */
    virtual void inspect(std::span<const std::uint8_t> input, std::ostream& out) const = 0;

    /**
     * @brief Entry point: walk, classify and reconstruct.
     *
     * Under StripPolicy::None the input is returned unchanged without
     * being walked.
     */
    [[nodiscard]] std::vector<std::uint8_t> strip(std::span<const std::uint8_t> input, StripPolicy policy) const;
};

} // namespace metascrub

#endif // METASCRUB_CONTAINER_ENGINE_HPP
