#pragma once

#include <string>
#include <vector>
#include <optional>

#include <QJsonObject>
#include <QJsonArray>

/* Catalog objects as returned by the Web API. Only the fields the tagger and
*  the front end use are kept; parsing is lenient for optional fields and
*  throws RemoteServiceError when the shape of the response is wrong.
*/

struct Image {
    std::string url;
    int width = 0;
    int height = 0;
};

struct ArtistRef {
    std::string id;
    std::string name;
};

struct AlbumRef {
    std::string id;
    std::string name;
    std::string album_type;
    std::vector<ArtistRef> artists;
    std::string release_date;
    std::string release_date_precision;
    std::vector<Image> images;

    // Largest image, or nullptr if the album has none
    const Image* cover() const;
    static AlbumRef from_json(const QJsonObject &json);
};

struct Track {
    std::string id;
    std::string name;
    std::vector<ArtistRef> artists;

    // Absent for the simplified tracks of album listings
    std::optional<AlbumRef> album;
    int track_number = 0;
    int disc_number = 0;
    int duration_ms = 0;
    bool is_explicit = false;
    std::string isrc;

    std::string uri() const { return "spotify:track:" + id; }
    std::vector<std::string> artist_names() const;
    static Track from_json(const QJsonObject &json);
};

struct Album : AlbumRef {
    std::string label;
    std::vector<std::string> genres;
    int total_tracks = 0;

    // First page of the track listing only
    std::vector<Track> tracks;

    static Album from_json(const QJsonObject &json);
};

struct PlaylistItem {
    // "track", "episode", or empty for a vacant slot
    std::string type;
    std::optional<Track> track;
};

struct Playlist {
    std::string id;
    std::string name;
    std::string description;
    std::string owner;
    int total_tracks = 0;
    std::vector<PlaylistItem> items;

    static Playlist from_json(const QJsonObject &json);
};

struct Artist {
    std::string id;
    std::string name;
    std::vector<std::string> genres;
    int popularity = 0;
    int followers = 0;
    std::vector<Image> images;

    static Artist from_json(const QJsonObject &json);
};

// One page of a paged listing
struct Page {
    QJsonArray items;
    int offset = 0;
    int total = 0;
    bool has_next = false;

    static Page from_json(const QJsonObject &json);
};

std::vector<std::string> names(const std::vector<ArtistRef> &artists);
