#pragma once

#include <string>
#include <vector>

#include <QString>
#include <QJsonArray>
#include <spdlog/logger.h>

#include "catalog.hpp"
#include "uri.hpp"

class MetadataClient;

#define PAGE_LIMIT 50

/* Flattens collections into ordered track lists. Pages are requested one at
*  a time; the first failing request aborts the whole expansion and nothing
*  collected so far is returned.
*/
class CatalogExpander {
    public:
        explicit CatalogExpander(MetadataClient &client);

        // Tracks of the first page of the playlist, episodes and vacant slots removed
        std::vector<Track> full_playlist(const std::string &id);
        std::vector<Track> full_album(const std::string &id);

        // Albums in listing order, tracks in album order, no deduplication
        std::vector<Track> full_artist(const std::string &id);

        std::vector<Track> expand(const Reference &reference);

    private:
        MetadataClient &client;
        spdlog::logger &logger;

        template <typename Callback>
        void for_each_page(const QString &endpoint, Callback &&callback);
};
