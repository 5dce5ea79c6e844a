/**
 * @file container_record.hpp
 * @brief The record type produced by every chunk walker.
 */

#ifndef METASCRUB_CONTAINER_RECORD_HPP
#define METASCRUB_CONTAINER_RECORD_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace metascrub {

/**
 * @brief One typed, length-prefixed unit inside a container.
 *
 * Both the identifier and the payload are views into the walked input
 * buffer; a record never outlives the buffer it was walked from.
 */
struct ContainerRecord {
    std::string_view id;                    ///< Four-character chunk type or layout tag
    std::span<const std::uint8_t> payload;  ///< Payload bytes, padding and CRC excluded
    std::uint32_t byte_length = 0;          ///< Payload length as it will be written
    std::size_t offset = 0;                 ///< Offset of the record header in the input
    std::uint32_t crc = 0;                  ///< PNG only: CRC passed through verbatim
};

/**
 * @brief Sensitivity class assigned to a record by an engine's classifier.
 */
enum class ChunkClass {
    Essential, ///< Required for the file to decode at all
    Safe,      ///< Non-essential but non-sensitive
    Unsafe     ///< May carry identifying or authoring metadata
};

inline const char* chunk_class_to_string(const ChunkClass cls) {
    switch (cls) {
        case ChunkClass::Essential: return "essential";
        case ChunkClass::Safe:      return "safe";
        case ChunkClass::Unsafe:    return "unsafe";
    }
    return "";
}

} // namespace metascrub

#endif // METASCRUB_CONTAINER_RECORD_HPP
