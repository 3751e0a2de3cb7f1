#include <string>
#include <vector>
#include <variant>

#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <QJsonObject>
#include <fmt/core.h>
#include <spdlog/logger.h>

#include "metadata_client.hpp"
#include "web_api.hpp"
#include "util.hpp"

static QString endpoint(const char *collection, const std::string &id)
{
    return QStringLiteral("/") + QLatin1String(collection) + QStringLiteral("/")
        + QString::fromLatin1(QUrl::toPercentEncoding(QString::fromStdString(id)));
}

QUrlQuery MetadataClient::query() const
{
    QUrlQuery query;
    if (!market.empty())
        query.addQueryItem("market", QString::fromStdString(market));
    return query;
}

ResolvedItem MetadataClient::resolve(const Reference &reference)
{
    switch (reference.kind) {
        case Reference::Kind::TRACK:
            return track(reference.id);
        case Reference::Kind::PLAYLIST:
            return playlist(reference.id);
        case Reference::Kind::ALBUM:
            return album(reference.id);
        case Reference::Kind::ARTIST:
            return artist(reference.id);
        default:
            logger.debug("Not resolving unsupported reference '{}'", reference.id);
            return Other {reference.id};
    }
}

Track MetadataClient::track(const std::string &id)
{
    logger.debug("Fetching track {}", id);
    return Track::from_json(api.get(endpoint("tracks", id), query()));
}

Album MetadataClient::album(const std::string &id)
{
    logger.debug("Fetching album {}", id);
    return Album::from_json(api.get(endpoint("albums", id), query()));
}

// Only the first page of the playlist's entries is part of the response
Playlist MetadataClient::playlist(const std::string &id)
{
    logger.debug("Fetching playlist {}", id);
    return Playlist::from_json(api.get(endpoint("playlists", id), query()));
}

// The artist endpoint takes no market
Artist MetadataClient::artist(const std::string &id)
{
    logger.debug("Fetching artist {}", id);
    return Artist::from_json(api.get(endpoint("artists", id), QUrlQuery()));
}

std::vector<Track> MetadataClient::search(const std::string &query_string)
{
    QUrlQuery params = query();
    // QUrlQuery leaves '+' alone, which the service would read as a space
    params.addQueryItem("q", QString::fromLatin1(QUrl::toPercentEncoding(QString::fromStdString(query_string))));
    params.addQueryItem("type", "track");
    params.addQueryItem("limit", QString::number(SEARCH_LIMIT));
    params.addQueryItem("offset", "0");
    params.addQueryItem("include_external", "audio");
    logger.debug("Searching for '{}'", query_string);

    const QJsonObject json = api.get("/search", params);
    std::vector<Track> tracks;
    if (!json.value("tracks").isObject())
        return tracks;
    const Page page = Page::from_json(json.value("tracks").toObject());
    for (const auto &item : page.items)
        tracks.push_back(Track::from_json(item.toObject()));
    return tracks;
}

std::string describe(const ResolvedItem &item)
{
    struct {
        std::string operator()(const Track &t) {
            return fmt::format("Track: {} - {}{}", join(t.artist_names(), ", "), t.name,
                               t.album ? fmt::format(" [{}]", t.album->name) : "");
        }
        std::string operator()(const Album &a) {
            return fmt::format("Album: {} - {} ({}, {} tracks)", join(names(a.artists), ", "), a.name,
                               a.release_date, a.total_tracks);
        }
        std::string operator()(const Playlist &p) {
            return fmt::format("Playlist: {} by {} ({} tracks)", p.name, p.owner, p.total_tracks);
        }
        std::string operator()(const Artist &a) {
            return fmt::format("Artist: {} ({} followers)", a.name, a.followers);
        }
        std::string operator()(const Other &o) {
            return fmt::format("Unsupported: {}", o.uri);
        }
    } visitor;
    return std::visit(visitor, item);
}
