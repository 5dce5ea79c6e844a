#include "../../include/container_engine.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace metascrub {

bool ContainerEngine::retains(const ChunkClass cls, const StripPolicy policy) const noexcept {
    switch (policy) {
        case StripPolicy::None: return true;
        case StripPolicy::Safe: return cls != ChunkClass::Unsafe;
        case StripPolicy::All:  return cls == ChunkClass::Essential;
    }
    return true;
}

std::vector<std::uint8_t> ContainerEngine::strip(const std::span<const std::uint8_t> input,
                                                 const StripPolicy policy) const {
    if (policy == StripPolicy::None) {
        Logger::log(LogLevel::Debug, "Strip policy none, returning input unchanged", name());
        return {input.begin(), input.end()};
    }

    const auto records = walk(input);
    Logger::log(LogLevel::Debug, "Walked " + std::to_string(records.size()) + " records", name());
    for (const auto& record : records) {
        const ChunkClass cls = classify(record.id);
        Logger::log(LogLevel::Debug,
                    std::string(retains(cls, policy) ? "keep " : "drop ") + std::string(record.id) + " (" +
                    chunk_class_to_string(cls) + ", " + std::to_string(record.byte_length) + " bytes)",
                    name());
    }

    auto output = reconstruct(input, records, policy);
    if (output.size() < input.size()) {
        Logger::log(LogLevel::Info,
                    "Stripped " + std::to_string(input.size() - output.size()) + " bytes (policy " +
                    strip_policy_to_string(policy) + ")",
                    name());
    }
    return output;
}

} // namespace metascrub
