#pragma once

#include <string>
#include <vector>
#include <variant>

#include <QString>
#include <QUrlQuery>
#include <spdlog/logger.h>

#include "catalog.hpp"
#include "uri.hpp"

class WebApi;

#define SEARCH_LIMIT 50

// Reference kinds the client does not fetch. Keeps the original input.
struct Other {
    std::string uri;
};

using ResolvedItem = std::variant<Track, Album, Playlist, Artist, Other>;

class MetadataClient {
    public:
        // market: ISO 3166-1 alpha-2 code, or empty for no restriction
        MetadataClient(WebApi &api, const std::string &market, spdlog::logger &logger)
        : api(api), market(market), logger(logger) {}

        ResolvedItem resolve(const Reference &reference);
        std::vector<Track> search(const std::string &query);

        Track track(const std::string &id);
        Album album(const std::string &id);
        Playlist playlist(const std::string &id);
        Artist artist(const std::string &id);

        // Market-scoped query shared with the catalog expander
        QUrlQuery query() const;
        WebApi& web_api() { return api; }
        spdlog::logger& get_logger() { return logger; }

    private:
        WebApi &api;
        const std::string market;
        spdlog::logger &logger;
};

std::string describe(const ResolvedItem &item);
