/**
 * @file processor_registry.hpp
 * @brief Registry that owns one IProcessor per supported format.
 */

#ifndef METASCRUB_PROCESSOR_REGISTRY_HPP
#define METASCRUB_PROCESSOR_REGISTRY_HPP

#include "processor.hpp"
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace metascrub {

/**
 * @brief Registry of all available processors.
 *
 * @details Owns the concrete processors (PNG, WebP, WAV, MP3) and looks
 * them up by MIME type or file extension. Lookup is read-only, so one
 * registry may serve every worker thread.
 */
class ProcessorRegistry {
public:
    /// Registers all built-in processors.
    ProcessorRegistry();

    /**
     * @brief Processors that support a MIME type.
     * @param mime MIME type string (e.g. "image/png").
     */
    [[nodiscard]] std::vector<IProcessor*> find_by_mime(const std::string& mime) const;

    /**
     * @brief Processors that support a file extension (case-insensitive).
     * @param ext Extension including the dot (e.g. ".png").
     */
    [[nodiscard]] std::vector<IProcessor*> find_by_extension(const std::string& ext) const;

    /**
     * @brief Picks the processor for a file: content MIME type first,
     * then the extension.
     * @param path The file; its content is sniffed through MimeDetector.
     * @param mime_out If non-null, receives the detected MIME type.
     * @return The processor, or nullptr if the file is unsupported.
     */
    [[nodiscard]] IProcessor* find_for(const std::filesystem::path& path, std::string* mime_out = nullptr) const;

    /**
     * @brief Picks the processor for bytes already in memory.
     *
     * The content MIME type is mapped to a MediaFormat first; ext (with
     * the dot) is the fallback.
     * @param mime_out If non-null, receives the detected MIME type.
     * @return The processor, or nullptr if the data is unsupported.
     */
    [[nodiscard]] IProcessor* find_for_data(std::span<const std::uint8_t> data,
                                            const std::string& ext,
                                            std::string* mime_out = nullptr) const;

    /// @return The processor for format, or nullptr.
    [[nodiscard]] IProcessor* find_by_format(MediaFormat format) const;

    /// @return Constant reference to the owned processors.
    [[nodiscard]] const std::vector<std::unique_ptr<IProcessor>>& all() const { return processors_; }

private:
    std::vector<std::unique_ptr<IProcessor>> processors_;
};

} // namespace metascrub

#endif // METASCRUB_PROCESSOR_REGISTRY_HPP
