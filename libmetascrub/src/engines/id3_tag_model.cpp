#include "../../include/id3_tag_model.hpp"
#include "../../include/byte_io.hpp"
#include "../../include/errors.hpp"
#include "../../include/inspect_util.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <taglib/tbytevector.h>
#include <taglib/tbytevectorstream.h>
#include <taglib/mpegfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/id3v2header.h>
#include <taglib/id3v2frame.h>
#include <taglib/attachedpictureframe.h>
#include <taglib/commentsframe.h>
#include <taglib/privateframe.h>
#include <taglib/textidentificationframe.h>
#include <taglib/unknownframe.h>
#include <taglib/unsynchronizedlyricsframe.h>
#include <taglib/urllinkframe.h>

namespace metascrub {

namespace {

std::string to_std(const TagLib::String& s) {
    return s.to8Bit(true);
}

std::string to_std(const TagLib::ByteVector& v) {
    return {v.data(), v.size()};
}

std::vector<std::uint8_t> to_bytes(const TagLib::ByteVector& v) {
    const auto* p = reinterpret_cast<const std::uint8_t*>(v.data());
    return {p, p + v.size()};
}

std::string describe_frame(const TagLib::ID3v2::Frame* frame) {
    using namespace TagLib::ID3v2;

    if (const auto* pic = dynamic_cast<const AttachedPictureFrame*>(frame)) {
        return "Image (" + to_std(pic->mimeType()) + "), " + std::to_string(pic->picture().size()) +
               " bytes, description: '" + to_std(pic->description()) + "'";
    }
    if (const auto* comm = dynamic_cast<const CommentsFrame*>(frame)) {
        return "[" + to_std(comm->language()) + "] " + to_std(comm->description()) + ": " + to_std(comm->text());
    }
    if (const auto* lyrics = dynamic_cast<const UnsynchronizedLyricsFrame*>(frame)) {
        return "[" + to_std(lyrics->language()) + "] " + to_std(lyrics->text());
    }
    if (const auto* txxx = dynamic_cast<const UserTextIdentificationFrame*>(frame)) {
        const TagLib::StringList fields = txxx->fieldList();
        std::string value;
        // the first field repeats the description
        for (unsigned i = 1; i < fields.size(); ++i) {
            if (!value.empty()) value += "; ";
            value += to_std(fields[i]);
        }
        return to_std(txxx->description()) + ": " + value;
    }
    if (const auto* wxxx = dynamic_cast<const UserUrlLinkFrame*>(frame)) {
        return to_std(wxxx->description()) + ": " + to_std(wxxx->url());
    }
    if (const auto* unknown = dynamic_cast<const UnknownFrame*>(frame)) {
        const auto bytes = to_bytes(unknown->data());
        return format_unknown_data(bytes);
    }
    return to_std(frame->toString());
}

constexpr std::uint8_t kFlagExtendedHeader = 0x40;
constexpr std::uint8_t kFlagFooter = 0x10;

// Cuts a rendered v2.4 tag down to header plus frames. TagLib keeps the old
// tag size by padding, which would leave the file no smaller than before.
std::vector<std::uint8_t> without_padding(const std::vector<std::uint8_t>& rendered) {
    const std::size_t header = TagLib::ID3v2::Header::size();
    const std::size_t declared_end = std::min<std::size_t>(header + decode_synchsafe(rendered, 6), rendered.size());

    std::size_t pos = header;
    if (rendered[5] & kFlagExtendedHeader) {
        pos += decode_synchsafe(rendered, header);
    }
    while (pos + header <= declared_end && rendered[pos] != 0) {
        const std::size_t frame_end = pos + header + decode_synchsafe(rendered, pos + 4);
        if (frame_end > declared_end) {
            throw EncodeError("TagLib rendered a frame past the end of the tag");
        }
        pos = frame_end;
    }

    std::vector<std::uint8_t> out(rendered.begin(), rendered.begin() + 6);
    out[5] &= static_cast<std::uint8_t>(~kFlagFooter);
    append_synchsafe(out, static_cast<std::uint32_t>(pos - header));
    out.insert(out.end(), rendered.begin() + static_cast<std::ptrdiff_t>(header),
               rendered.begin() + static_cast<std::ptrdiff_t>(pos));
    return out;
}

} // namespace

struct Id3TagModel::Impl {
    TagLib::ByteVectorStream stream;
    TagLib::MPEG::File file;

    explicit Impl(const TagLib::ByteVector& data)
        : stream(data), file(&stream, false) {}
};

Id3TagModel::Id3TagModel(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
Id3TagModel::~Id3TagModel() = default;
Id3TagModel::Id3TagModel(Id3TagModel&&) noexcept = default;
Id3TagModel& Id3TagModel::operator=(Id3TagModel&&) noexcept = default;

std::unique_ptr<Id3TagModel> Id3TagModel::parse(const std::span<const std::uint8_t> tag_bytes) {
    const TagLib::ByteVector data(reinterpret_cast<const char*>(tag_bytes.data()),
                                  static_cast<unsigned int>(tag_bytes.size()));
    auto impl = std::make_unique<Impl>(data);
    if (!impl->file.isValid() || !impl->file.hasID3v2Tag() || !impl->file.ID3v2Tag()) {
        Logger::log(LogLevel::Debug, "TagLib found no ID3v2 tag", "id3");
        return nullptr;
    }
    return std::unique_ptr<Id3TagModel>(new Id3TagModel(std::move(impl)));
}

unsigned Id3TagModel::major_version() const {
    return impl_->file.ID3v2Tag()->header()->majorVersion();
}

std::size_t Id3TagModel::frame_count() const {
    return impl_->file.ID3v2Tag()->frameList().size();
}

std::vector<Id3Frame> Id3TagModel::frames() const {
    std::vector<Id3Frame> result;
    for (const auto* frame : impl_->file.ID3v2Tag()->frameList()) {
        Id3Frame info;
        info.id = to_std(frame->frameID());
        if (const auto* priv = dynamic_cast<const TagLib::ID3v2::PrivateFrame*>(frame)) {
            info.is_private = true;
            info.owner = to_std(priv->owner());
            info.private_data = to_bytes(priv->data());
            info.value = "Owner: " + info.owner + ", Data: " + format_unknown_data(info.private_data);
        } else {
            info.value = describe_frame(frame);
        }
        result.push_back(std::move(info));
    }
    return result;
}

std::size_t Id3TagModel::retain_frames(const std::function<bool(std::string_view)>& keep) {
    auto* tag = impl_->file.ID3v2Tag();
    // copy: removeFrame() mutates the tag's own list
    const TagLib::ID3v2::FrameList snapshot = tag->frameList();
    std::size_t removed = 0;
    for (auto* frame : snapshot) {
        const std::string id = to_std(frame->frameID());
        if (!keep(id)) {
            tag->removeFrame(frame, true);
            ++removed;
        }
    }
    return removed;
}

std::vector<std::uint8_t> Id3TagModel::render_v24() const {
    const TagLib::ByteVector rendered = impl_->file.ID3v2Tag()->render(TagLib::ID3v2::v4);
    if (rendered.size() < TagLib::ID3v2::Header::size()) {
        throw EncodeError("TagLib rendered an empty ID3v2 tag");
    }
    return without_padding(to_bytes(rendered));
}

} // namespace metascrub
