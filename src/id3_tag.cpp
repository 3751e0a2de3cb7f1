#include <string>
#include <vector>
#include <memory>
#include <algorithm>
#include <filesystem>

#include <taglib/tstring.h>
#include <taglib/tbytevector.h>
#include <taglib/mpegfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/textidentificationframe.h>
#include <taglib/attachedpictureframe.h>
#include <taglib/uniquefileidentifierframe.h>

#include "id3_tag.hpp"
#include "error.hpp"
#include "util.hpp"

#define UTF8(s) TagLib::String(s, TagLib::String::Type::UTF8)

static const char* frame_id(Field field)
{
    switch (field) {
        case Field::TITLE:        return "TIT2";
        case Field::ARTIST:       return "TPE1";
        case Field::ALBUM:        return "TALB";
        case Field::TRACK_NUMBER: return "TRCK";
        case Field::DISC_NUMBER:  return "TPOS";
        case Field::GENRE:        return "TCON";
        case Field::LABEL:        return "TPUB";
        case Field::ALBUM_ARTIST: return "TPE2";
    }
    return "";
}

// Declared text information frames, excluding the user defined TXXX
static bool is_text_frame_id(const std::string &key)
{
    return key.size() == 4 && key.front() == 'T' && key != "TXXX"
        && std::all_of(key.begin(), key.end(), [](char c){ return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'); });
}

Id3Tag::Id3Tag(const std::filesystem::path &path) : path(path)
{
    file = std::make_unique<TagLib::MPEG::File>(path.string().c_str(), false);
    if (!file->isOpen() || !file->isValid())
        throw TagEncodingError("Could not open MPEG file '{}'", path.string());

    // Creates an empty tag if the file has none
    tag = file->ID3v2Tag(true);
}

void Id3Tag::set_text(const TagLib::ByteVector &frame_id, const std::string &value)
{
    tag->removeFrames(frame_id);
    if (value.empty())
        return;
    auto frame = new TagLib::ID3v2::TextIdentificationFrame(frame_id, TagLib::String::Type::UTF8);
    frame->setText(UTF8(value));
    tag->addFrame(frame);
}

void Id3Tag::set_raw(const std::string &key, const std::vector<std::string> &values)
{
    const std::string value = join(values, separator);
    if (is_text_frame_id(key)) {
        set_text(TagLib::ByteVector(key.c_str()), value);
        return;
    }

    // Anything else is stored as a user text frame described by the key
    const TagLib::String description = UTF8(key);
    auto existing = TagLib::ID3v2::UserTextIdentificationFrame::find(tag, description);
    if (existing)
        tag->removeFrame(existing);
    if (value.empty())
        return;
    auto frame = new TagLib::ID3v2::UserTextIdentificationFrame(TagLib::String::Type::UTF8);
    frame->setDescription(description);
    frame->setText(UTF8(value));
    tag->addFrame(frame);
}

void Id3Tag::set_field(Field field, const std::vector<std::string> &values)
{
    set_text(frame_id(field), join(values, separator));
}

// TDRC is converted to TYER/TDAT/TIME by TagLib when writing ID3v2.3
void Id3Tag::set_release_date(const std::string &date)
{
    const auto timestamp = Timestamp::parse(date);
    if (!timestamp)
        throw TagEncodingError("Invalid release date '{}'", date);
    set_text("TDRC", timestamp->to_string());
}

void Id3Tag::add_cover(const std::string &mime, const std::vector<char> &data)
{
    const TagLib::ID3v2::FrameList pictures = tag->frameList("APIC");
    for (const auto &picture : pictures) {
        const auto frame = dynamic_cast<TagLib::ID3v2::AttachedPictureFrame*>(picture);
        if (frame && frame->type() == TagLib::ID3v2::AttachedPictureFrame::Type::FrontCover)
            tag->removeFrame(frame);
    }

    auto frame = new TagLib::ID3v2::AttachedPictureFrame();
    frame->setMimeType(mime);
    frame->setType(TagLib::ID3v2::AttachedPictureFrame::Type::FrontCover);
    frame->setDescription(COVER_DESCRIPTION);
    frame->setPicture(TagLib::ByteVector(data.data(), static_cast<unsigned int>(data.size())));
    tag->addFrame(frame);
}

void Id3Tag::add_unique_file_identifier(const std::string &track_id)
{
    const TagLib::ID3v2::FrameList frames = tag->frameList("UFID");
    for (const auto &f : frames) {
        const auto ufid = dynamic_cast<TagLib::ID3v2::UniqueFileIdentifierFrame*>(f);
        if (ufid && ufid->owner() == UFID_OWNER)
            tag->removeFrame(ufid);
    }
    tag->addFrame(new TagLib::ID3v2::UniqueFileIdentifierFrame(UFID_OWNER, TagLib::ByteVector(track_id.c_str())));
}

void Id3Tag::save()
{
    if (!file->save(TagLib::MPEG::File::TagTypes::ID3v2,
            TagLib::File::StripTags::StripNone,
            version,
            TagLib::File::DuplicateTags::DoNotDuplicate
        ))
        throw TagEncodingError("Could not write ID3v2 tag to '{}'", path.string());
}
