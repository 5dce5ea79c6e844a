/**
 * @file mime_detector.hpp
 * @brief Content-based MIME type detection through libmagic.
 */

#ifndef METASCRUB_MIME_DETECTOR_HPP
#define METASCRUB_MIME_DETECTOR_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace metascrub {

    /**
     * @brief Detects MIME types by content.
     *
     * Each call opens its own libmagic cookie, so detection is safe from
     * any worker thread.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         * @return A MIME type such as "image/png", or an empty string if
         * libmagic is unavailable or fails.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Detect the MIME type of an in-memory buffer.
         * @return A MIME type, or an empty string on failure.
         */
        static std::string detect(std::span<const std::uint8_t> data);
    };

} // namespace metascrub

#endif // METASCRUB_MIME_DETECTOR_HPP
