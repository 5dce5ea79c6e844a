/**
 * @file media_format.hpp
 * @brief Enumeration of the supported media formats and lookup helpers.
 */

#ifndef METASCRUB_MEDIA_FORMAT_HPP
#define METASCRUB_MEDIA_FORMAT_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <unordered_map>

namespace metascrub {

/**
 * @brief Formats metascrub can strip.
 */
enum class MediaFormat {
    Png,
    Webp,
    Wav,
    Mp3,
    Unknown
};

///< Map linking MIME type strings (as reported by libmagic) to formats.
inline const std::unordered_map<std::string, MediaFormat> mime_to_format = {
    { "image/png",      MediaFormat::Png },
    { "image/webp",     MediaFormat::Webp },
    { "audio/wav",      MediaFormat::Wav },
    { "audio/x-wav",    MediaFormat::Wav },
    { "audio/vnd.wave", MediaFormat::Wav },
    { "audio/mpeg",     MediaFormat::Mp3 },
    { "audio/mp3",      MediaFormat::Mp3 },
};

/**
 * @brief Converts a MediaFormat to its lowercase name.
 * @return A string (e.g., "png", "mp3", "unknown").
 */
inline std::string media_format_to_string(const MediaFormat fmt) {
    switch (fmt) {
        case MediaFormat::Png:  return "png";
        case MediaFormat::Webp: return "webp";
        case MediaFormat::Wav:  return "wav";
        case MediaFormat::Mp3:  return "mp3";
        default:                return "unknown";
    }
}

/**
 * @brief Parses a file extension (with or without the dot) into a MediaFormat.
 *
 * Case-insensitive: ".PNG", "png" and ".Png" all map to MediaFormat::Png.
 *
 * @return The format, or std::nullopt for an unsupported extension.
 */
inline std::optional<MediaFormat> parse_media_format(const std::string& str) {
    std::string s = str;
    if (!s.empty() && s.front() == '.') s.erase(0, 1);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if (s == "png")  return MediaFormat::Png;
    if (s == "webp") return MediaFormat::Webp;
    if (s == "wav" || s == "wave") return MediaFormat::Wav;
    if (s == "mp3")  return MediaFormat::Mp3;
    return std::nullopt;
}

} // namespace metascrub

#endif // METASCRUB_MEDIA_FORMAT_HPP
