#include "../../include/riff_engine.hpp"
#include "../../include/byte_io.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace metascrub {

namespace {
constexpr std::size_t kRiffHeaderSize = 12;
constexpr std::size_t kChunkHeaderSize = 8;
} // namespace

std::vector<ContainerRecord> RiffEngine::walk(const std::span<const std::uint8_t> input) const {
    if (input.size() < kRiffHeaderSize || !has_tag_at(input, 0, "RIFF") || !has_tag_at(input, 8, form_type_)) {
        throw DecodeError("Not a RIFF/" + std::string(form_type_) + " file");
    }

    std::vector<ContainerRecord> records;
    std::size_t pos = kRiffHeaderSize;

    while (pos < input.size()) {
        const std::size_t remaining = input.size() - pos;
        if (remaining < kChunkHeaderSize) {
            if (tolerate_truncation_) {
                Logger::log(LogLevel::Warning,
                            "Ignoring " + std::to_string(remaining) + " trailing bytes after last chunk", name());
                break;
            }
            throw DecodeError("Truncated chunk header at offset " + std::to_string(pos));
        }

        const std::string_view id = tag_view(input, pos);
        const std::uint32_t declared = read_u32_le(input, pos + 4);
        const std::size_t available = remaining - kChunkHeaderSize;

        ContainerRecord record;
        record.id = id;
        record.offset = pos;

        if (declared > available) {
            if (!tolerate_truncation_) {
                throw DecodeError("Chunk '" + std::string(id) + "' declares " + std::to_string(declared) +
                                  " bytes but only " + std::to_string(available) + " remain");
            }
            Logger::log(LogLevel::Warning,
                        "Chunk '" + std::string(id) + "' truncated from " + std::to_string(declared) + " to " +
                        std::to_string(available) + " bytes",
                        name());
            record.payload = input.subspan(pos + kChunkHeaderSize, available);
            record.byte_length = static_cast<std::uint32_t>(available);
            records.push_back(record);
            break;
        }

        record.payload = input.subspan(pos + kChunkHeaderSize, declared);
        record.byte_length = declared;
        records.push_back(record);

        pos += kChunkHeaderSize + declared;
        // a missing pad byte on the final chunk is tolerated
        if ((declared & 1u) != 0 && pos < input.size()) {
            ++pos;
        }
    }

    return records;
}

void RiffEngine::write_chunk(std::vector<std::uint8_t>& out,
                             const std::string_view id,
                             const std::span<const std::uint8_t> payload) {
    append_tag(out, id);
    append_u32_le(out, static_cast<std::uint32_t>(payload.size()));
    append_bytes(out, payload);
    if ((payload.size() & 1u) != 0) {
        out.push_back(0);
    }
}

void RiffEngine::append_chunk(std::vector<std::uint8_t>& out,
                              const ContainerRecord& record,
                              const std::vector<const ContainerRecord*>&) const {
    write_chunk(out, record.id, record.payload);
}

std::vector<std::uint8_t> RiffEngine::reconstruct(const std::span<const std::uint8_t> input,
                                                  const std::vector<ContainerRecord>& records,
                                                  const StripPolicy policy) const {
    std::vector<const ContainerRecord*> retained;
    retained.reserve(records.size());
    for (const auto& record : records) {
        if (retains(classify(record.id), policy)) {
            retained.push_back(&record);
        } else {
            Logger::log(LogLevel::Debug,
                        "Dropping chunk '" + std::string(record.id) + "' (" +
                        std::to_string(record.byte_length) + " bytes)",
                        name());
        }
    }

    std::vector<std::uint8_t> out;
    out.reserve(input.size());
    append_tag(out, "RIFF");
    append_u32_le(out, 0); // patched below
    append_tag(out, form_type_);

    for (const auto* record : retained) {
        append_chunk(out, *record, retained);
    }

    patch_u32_le(out, 4, static_cast<std::uint32_t>(out.size() - 8));
    return out;
}

} // namespace metascrub
