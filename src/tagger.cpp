#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <QByteArray>
#include <spdlog/logger.h>

#include "tagger.hpp"
#include "tag.hpp"
#include "config.hpp"
#include "error.hpp"

void Tagger::write(const std::filesystem::path &path, Codec codec, const Track &track,
                   const std::optional<Album> &album, const QByteArray &cover)
{
    TagWrap tag(path, codec, logger, config.get_id3v2_version());
    tag.set_separator(config.separator);

    tag.set_field(Field::TITLE, {track.name});
    tag.set_field(Field::ARTIST, track.artist_names());
    if (track.track_number > 0)
        tag.set_field(Field::TRACK_NUMBER, {std::to_string(track.track_number)});
    if (track.disc_number > 0)
        tag.set_field(Field::DISC_NUMBER, {std::to_string(track.disc_number)});

    const AlbumRef *ref = album ? &*album : (track.album ? &*track.album : nullptr);
    if (ref) {
        tag.set_field(Field::ALBUM, {ref->name});
        tag.set_field(Field::ALBUM_ARTIST, names(ref->artists));
        if (!ref->release_date.empty()) {
            try {
                tag.set_release_date(ref->release_date);
            }
            catch (const TagEncodingError &e) {
                logger.warn("Skipping release date: {}", e.what());
            }
        }
    }
    if (album) {
        if (!album->genres.empty())
            tag.set_field(Field::GENRE, album->genres);
        if (!album->label.empty())
            tag.set_field(Field::LABEL, {album->label});
    }

    if (config.embed_cover && !cover.isEmpty()) {
        std::string mime = mime_from_image(cover);
        if (mime.empty()) {
            logger.warn("Unrecognized cover image format, assuming JPEG");
            mime = "image/jpeg";
        }
        tag.add_cover(mime, std::vector<char>(cover.begin(), cover.end()));
    }

    if (!track.id.empty())
        tag.add_unique_file_identifier(track.id);
    tag.save();
}
