#include <string>
#include <vector>
#include <memory>
#include <algorithm>
#include <filesystem>

#include <taglib/tstring.h>
#include <taglib/tbytevector.h>
#include <taglib/vorbisfile.h>
#include <taglib/xiphcomment.h>
#include <taglib/flacpicture.h>

#include "ogg_tag.hpp"
#include "error.hpp"
#include "util.hpp"

#define UTF8(s) TagLib::String(s, TagLib::String::Type::UTF8)

static const char* vorbis_key(Field field)
{
    switch (field) {
        case Field::TITLE:        return "TITLE";
        case Field::ARTIST:       return "ARTIST";
        case Field::ALBUM:        return "ALBUM";
        case Field::TRACK_NUMBER: return "TRACKNUMBER";
        case Field::DISC_NUMBER:  return "DISCNUMBER";
        case Field::GENRE:        return "GENRE";
        case Field::LABEL:        return "LABEL";
        case Field::ALBUM_ARTIST: return "ALBUMARTIST";
    }
    return "";
}

// Field names are printable ASCII 0x20 through 0x7D, excluding '='
static bool is_valid_key(const std::string &key)
{
    return !key.empty() && std::all_of(key.begin(), key.end(), [](char c){ return c >= 0x20 && c <= 0x7D && c != '='; });
}

OggTag::OggTag(const std::filesystem::path &path) : path(path)
{
    file = std::make_unique<TagLib::Ogg::Vorbis::File>(path.string().c_str(), false);
    if (!file->isOpen() || !file->isValid())
        throw TagEncodingError("Could not open Ogg Vorbis file '{}'", path.string());

    // A valid stream always carries a comment header, possibly empty
    tag = file->tag();
}

void OggTag::set_raw(const std::string &key, const std::vector<std::string> &values)
{
    if (!is_valid_key(key))
        throw TagEncodingError("Invalid Vorbis comment field name '{}'", key);

    // Replaces the previous values; an empty value only removes them
    tag->addField(key, UTF8(join(values, separator)), true);
}

void OggTag::set_field(Field field, const std::vector<std::string> &values)
{
    set_raw(vorbis_key(field), values);
}

void OggTag::set_release_date(const std::string &date)
{
    const auto timestamp = Timestamp::parse(date);
    if (!timestamp)
        throw TagEncodingError("Invalid release date '{}'", date);
    tag->addField("DATE", timestamp->to_string(), true);
}

void OggTag::add_cover(const std::string &mime, const std::vector<char> &data)
{
    const TagLib::List<TagLib::FLAC::Picture*> pictures = tag->pictureList();
    for (const auto &picture : pictures) {
        if (picture->type() == TagLib::FLAC::Picture::Type::FrontCover)
            tag->removePicture(picture, true);
    }

    auto picture = new TagLib::FLAC::Picture;
    picture->setData(TagLib::ByteVector(data.data(), static_cast<unsigned int>(data.size())));
    picture->setMimeType(mime);
    picture->setType(TagLib::FLAC::Picture::Type::FrontCover);
    picture->setDescription(COVER_DESCRIPTION);
    tag->addPicture(picture);
}

void OggTag::add_unique_file_identifier(const std::string &track_id)
{
    tag->addField(UFID_VORBIS_KEY, UTF8(track_id), true);
}

void OggTag::save()
{
    if (!file->save())
        throw TagEncodingError("Could not write Vorbis comment to '{}'", path.string());
}
