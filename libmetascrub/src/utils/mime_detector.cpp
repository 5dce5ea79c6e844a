#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <magic.h>
#include <memory>

namespace metascrub {

namespace {

    struct MagicCloser {
        void operator()(magic_set* cookie) const { magic_close(cookie); }
    };

    using unique_magic = std::unique_ptr<magic_set, MagicCloser>;

    unique_magic open_magic() {
        unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
        if (!magic) {
            Logger::log(LogLevel::Debug, "magic_open failed", "libmagic");
            return nullptr;
        }
        if (magic_load(magic.get(), nullptr) != 0) {
            Logger::log(LogLevel::Debug, std::string("magic_load failed: ") + magic_error(magic.get()), "libmagic");
            return nullptr;
        }
        return magic;
    }

} // namespace

std::string MimeDetector::detect(const std::filesystem::path& path) {
    const unique_magic magic = open_magic();
    if (!magic) return {};
    const char* mime = magic_file(magic.get(), path.string().c_str());
    return mime ? mime : "";
}

std::string MimeDetector::detect(const std::span<const std::uint8_t> data) {
    const unique_magic magic = open_magic();
    if (!magic) return {};
    const char* mime = magic_buffer(magic.get(), data.data(), data.size());
    return mime ? mime : "";
}

} // namespace metascrub
