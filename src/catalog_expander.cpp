#include <string>
#include <vector>
#include <utility>

#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <QJsonObject>
#include <spdlog/logger.h>

#include "catalog_expander.hpp"
#include "metadata_client.hpp"
#include "web_api.hpp"
#include "error.hpp"

CatalogExpander::CatalogExpander(MetadataClient &client)
: client(client), logger(client.get_logger()) {}

template <typename Callback>
void CatalogExpander::for_each_page(const QString &endpoint, Callback &&callback)
{
    int offset = 0;
    while (true) {
        QUrlQuery query = client.query();
        query.addQueryItem("limit", QString::number(PAGE_LIMIT));
        query.addQueryItem("offset", QString::number(offset));
        const Page page = Page::from_json(client.web_api().get(endpoint, query));
        logger.debug("{}: {} item(s) at offset {} of {}", endpoint.toStdString(), page.items.size(), offset, page.total);
        for (const auto &item : page.items)
            callback(item.toObject());

        // An empty page that still claims a successor would loop forever
        if (!page.has_next || page.items.isEmpty())
            break;
        offset += static_cast<int>(page.items.size());
    }
}

std::vector<Track> CatalogExpander::full_playlist(const std::string &id)
{
    Playlist playlist = client.playlist(id);
    std::vector<Track> tracks;
    for (auto &item : playlist.items) {
        if (item.track)
            tracks.push_back(std::move(*item.track));
        else if (!item.type.empty())
            logger.debug("Skipping playlist item of type '{}'", item.type);
    }
    if (playlist.total_tracks > static_cast<int>(playlist.items.size()))
        logger.warn("Playlist '{}' has {} entries, only the first {} are listed",
                    playlist.name, playlist.total_tracks, playlist.items.size());
    return tracks;
}

std::vector<Track> CatalogExpander::full_album(const std::string &id)
{
    std::vector<Track> tracks;
    const QString endpoint = QStringLiteral("/albums/") + QString::fromLatin1(QUrl::toPercentEncoding(QString::fromStdString(id))) + QStringLiteral("/tracks");
    for_each_page(endpoint, [&](const QJsonObject &item){ tracks.push_back(Track::from_json(item)); });
    logger.debug("Album {} has {} track(s)", id, tracks.size());
    return tracks;
}

std::vector<Track> CatalogExpander::full_artist(const std::string &id)
{
    std::vector<AlbumRef> albums;
    const QString endpoint = QStringLiteral("/artists/") + QString::fromLatin1(QUrl::toPercentEncoding(QString::fromStdString(id))) + QStringLiteral("/albums");
    for_each_page(endpoint, [&](const QJsonObject &item){
        AlbumRef album = AlbumRef::from_json(item);
        if (album.id.empty())
            throw RemoteServiceError("Album '{}' of artist {} has no id", album.name, id);
        albums.push_back(std::move(album));
    });
    logger.debug("Artist {} has {} album(s)", id, albums.size());

    std::vector<Track> tracks;
    for (const auto &album : albums) {
        std::vector<Track> album_tracks = full_album(album.id);
        for (auto &track : album_tracks) {
            track.album = album;
            tracks.push_back(std::move(track));
        }
    }
    return tracks;
}

std::vector<Track> CatalogExpander::expand(const Reference &reference)
{
    switch (reference.kind) {
        case Reference::Kind::TRACK:
            return {client.track(reference.id)};
        case Reference::Kind::PLAYLIST:
            return full_playlist(reference.id);
        case Reference::Kind::ALBUM:
            return full_album(reference.id);
        case Reference::Kind::ARTIST:
            return full_artist(reference.id);
        default:
            logger.warn("Cannot expand unsupported reference '{}'", reference.id);
            return {};
    }
}
