#include "../../include/processor_registry.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/mpeg_processor.hpp"
#include "../../include/png_processor.hpp"
#include "../../include/wav_processor.hpp"
#include "../../include/webp_processor.hpp"
#include <algorithm>
#include <cctype>

namespace metascrub {

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Processors whose list (MIME types or extensions) contains key, in registration order.
template<typename ListOf>
std::vector<IProcessor*> matching(const std::vector<std::unique_ptr<IProcessor>>& processors,
                                  const std::string_view key, ListOf list_of) {
    std::vector<IProcessor*> result;
    for (const auto& processor : processors) {
        const auto list = list_of(*processor);
        if (std::ranges::find(list, key) != list.end()) {
            result.push_back(processor.get());
        }
    }
    return result;
}

} // namespace

ProcessorRegistry::ProcessorRegistry() {
    processors_.reserve(4);
    processors_.push_back(std::make_unique<PngProcessor>());
    processors_.push_back(std::make_unique<WebpProcessor>());
    processors_.push_back(std::make_unique<WavProcessor>());
    processors_.push_back(std::make_unique<MpegProcessor>());
}

std::vector<IProcessor*> ProcessorRegistry::find_by_mime(const std::string& mime) const {
    if (mime.empty()) return {};
    return matching(processors_, mime, [](const IProcessor& p) { return p.get_supported_mime_types(); });
}

std::vector<IProcessor*> ProcessorRegistry::find_by_extension(const std::string& ext) const {
    if (ext.size() < 2 || ext.front() != '.') return {};
    const std::string wanted = lowercase(ext);
    return matching(processors_, wanted, [](const IProcessor& p) { return p.get_supported_extensions(); });
}

IProcessor* ProcessorRegistry::find_for(const std::filesystem::path& path, std::string* mime_out) const {
    const std::string mime = MimeDetector::detect(path);
    if (mime_out) *mime_out = mime;

    if (const auto by_content = find_by_mime(mime); !by_content.empty()) {
        return by_content.front();
    }
    const auto by_name = find_by_extension(path.extension().string());
    if (by_name.empty()) {
        return nullptr;
    }
    Logger::log(LogLevel::Debug,
                path.filename().string() + ": no processor for '" + mime + "', using the extension", "registry");
    return by_name.front();
}

IProcessor* ProcessorRegistry::find_by_format(const MediaFormat format) const {
    const auto it = std::ranges::find_if(processors_, [format](const auto& p) { return p->get_format() == format; });
    return it == processors_.end() ? nullptr : it->get();
}

IProcessor* ProcessorRegistry::find_for_data(const std::span<const std::uint8_t> data,
                                             const std::string& ext,
                                             std::string* mime_out) const {
    const std::string mime = MimeDetector::detect(data);
    if (mime_out) *mime_out = mime;

    if (const auto it = mime_to_format.find(mime); it != mime_to_format.end()) {
        if (IProcessor* processor = find_by_format(it->second)) {
            return processor;
        }
    }
    const auto by_name = find_by_extension(ext);
    return by_name.empty() ? nullptr : by_name.front();
}

} // namespace metascrub
