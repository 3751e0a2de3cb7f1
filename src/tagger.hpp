#pragma once

#include <filesystem>
#include <optional>

#include <QByteArray>
#include <spdlog/logger.h>

#include "catalog.hpp"
#include "util.hpp"

struct Config;

// Writes a track's metadata into a local file through a TagWrap
class Tagger {
    public:
        Tagger(const Config &config, spdlog::logger &logger) : config(config), logger(logger) {}

        // album: the full album, for genres and label. cover: raw image bytes, may be empty.
        void write(const std::filesystem::path &path, Codec codec, const Track &track,
                   const std::optional<Album> &album, const QByteArray &cover);

    private:
        const Config &config;
        spdlog::logger &logger;
};
