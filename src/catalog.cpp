#include <string>
#include <vector>
#include <algorithm>

#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>
#include <QString>

#include "catalog.hpp"
#include "error.hpp"

static std::string string_value(const QJsonObject &json, const char *key)
{
    return json.value(key).toString().toStdString();
}

static std::string required_string(const QJsonObject &json, const char *key, const char *object)
{
    const QJsonValue value = json.value(key);
    if (!value.isString())
        throw RemoteServiceError("Malformed {} object: missing '{}'", object, key);
    return value.toString().toStdString();
}

static QJsonArray required_array(const QJsonObject &json, const char *key, const char *object)
{
    const QJsonValue value = json.value(key);
    if (!value.isArray())
        throw RemoteServiceError("Malformed {} object: missing '{}'", object, key);
    return value.toArray();
}

static std::vector<std::string> string_list(const QJsonObject &json, const char *key)
{
    std::vector<std::string> list;
    for (const auto &value : json.value(key).toArray())
        list.emplace_back(value.toString().toStdString());
    return list;
}

static std::vector<ArtistRef> artist_list(const QJsonObject &json)
{
    std::vector<ArtistRef> artists;
    for (const auto &value : json.value("artists").toArray()) {
        const QJsonObject artist = value.toObject();
        artists.push_back({string_value(artist, "id"), string_value(artist, "name")});
    }
    return artists;
}

static std::vector<Image> image_list(const QJsonObject &json)
{
    std::vector<Image> images;
    for (const auto &value : json.value("images").toArray()) {
        const QJsonObject image = value.toObject();
        images.push_back({string_value(image, "url"), image.value("width").toInt(), image.value("height").toInt()});
    }
    return images;
}

std::vector<std::string> names(const std::vector<ArtistRef> &artists)
{
    std::vector<std::string> list;
    list.reserve(artists.size());
    for (const auto &artist : artists)
        list.push_back(artist.name);
    return list;
}

const Image* AlbumRef::cover() const
{
    auto it = std::max_element(images.begin(), images.end(),
        [](const Image &a, const Image &b){ return a.width * a.height < b.width * b.height; }
    );
    return it == images.end() ? nullptr : &*it;
}

AlbumRef AlbumRef::from_json(const QJsonObject &json)
{
    AlbumRef album;
    album.id = string_value(json, "id");
    album.name = required_string(json, "name", "album");
    album.album_type = string_value(json, "album_type");
    album.artists = artist_list(json);
    album.release_date = string_value(json, "release_date");
    album.release_date_precision = string_value(json, "release_date_precision");
    album.images = image_list(json);
    return album;
}

std::vector<std::string> Track::artist_names() const
{
    return names(artists);
}

Track Track::from_json(const QJsonObject &json)
{
    Track track;

    // Local files in playlists have a null id
    track.id = string_value(json, "id");
    track.name = required_string(json, "name", "track");
    track.artists = artist_list(json);
    if (json.value("album").isObject())
        track.album = AlbumRef::from_json(json.value("album").toObject());
    track.track_number = json.value("track_number").toInt();
    track.disc_number = json.value("disc_number").toInt();
    track.duration_ms = json.value("duration_ms").toInt();
    track.is_explicit = json.value("explicit").toBool();
    track.isrc = string_value(json.value("external_ids").toObject(), "isrc");
    return track;
}

Album Album::from_json(const QJsonObject &json)
{
    Album album;
    static_cast<AlbumRef&>(album) = AlbumRef::from_json(json);
    album.label = string_value(json, "label");
    album.genres = string_list(json, "genres");
    album.total_tracks = json.value("total_tracks").toInt();

    const AlbumRef ref = album;
    const Page page = Page::from_json(json.value("tracks").toObject());
    for (const auto &item : page.items) {
        Track track = Track::from_json(item.toObject());
        track.album = ref;
        album.tracks.push_back(std::move(track));
    }
    return album;
}

Playlist Playlist::from_json(const QJsonObject &json)
{
    Playlist playlist;
    playlist.id = string_value(json, "id");
    playlist.name = required_string(json, "name", "playlist");
    playlist.description = string_value(json, "description");
    playlist.owner = string_value(json.value("owner").toObject(), "display_name");

    const Page page = Page::from_json(json.value("tracks").toObject());
    playlist.total_tracks = page.total;
    for (const auto &value : page.items) {
        PlaylistItem item;
        const QJsonValue track = value.toObject().value("track");
        if (track.isObject()) {
            const QJsonObject object = track.toObject();
            item.type = string_value(object, "type");
            if (item.type == "track")
                item.track = Track::from_json(object);
        }
        playlist.items.push_back(std::move(item));
    }
    return playlist;
}

Artist Artist::from_json(const QJsonObject &json)
{
    Artist artist;
    artist.id = string_value(json, "id");
    artist.name = required_string(json, "name", "artist");
    artist.genres = string_list(json, "genres");
    artist.popularity = json.value("popularity").toInt();
    artist.followers = json.value("followers").toObject().value("total").toInt();
    artist.images = image_list(json);
    return artist;
}

Page Page::from_json(const QJsonObject &json)
{
    Page page;
    page.items = required_array(json, "items", "paging");
    page.offset = json.value("offset").toInt();
    page.total = json.value("total").toInt();
    page.has_next = json.value("next").isString();
    return page;
}
