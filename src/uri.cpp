#include <string>
#include <algorithm>

#include <QUrl>
#include <QString>
#include <QStringList>
#include <fmt/core.h>

#include "uri.hpp"
#include "error.hpp"

std::string parse_uri(const std::string &input)
{
    // Already a URI
    if (input.starts_with(URI_SCHEME ":")) {
        if (std::count(input.begin(), input.end(), ':') < 2)
            throw InvalidReference("Invalid URI '{}'", input);
        return input;
    }

    const QUrl url(QString::fromStdString(input), QUrl::StrictMode);
    if (!url.isValid() || url.isRelative())
        throw InvalidReference("Malformed URL '{}'", input);
    if (url.host() != WEB_PLAYER_HOST)
        throw InvalidReference("'{}' is not a web player URL", input);

    const QStringList path = url.path().split('/', Qt::SkipEmptyParts);
    if (path.size() < 2)
        throw InvalidReference("URL '{}' does not name a resource", input);
    return fmt::format(URI_SCHEME ":{}:{}", path[0].toStdString(), path[1].toStdString());
}

Reference resolve_reference(const std::string &input)
{
    return Reference::from_uri(parse_uri(input));
}

Reference Reference::from_uri(const std::string &uri)
{
    static const std::pair<const char*, Kind> kinds[] {
        {"track",    Kind::TRACK},
        {"playlist", Kind::PLAYLIST},
        {"album",    Kind::ALBUM},
        {"artist",   Kind::ARTIST}
    };
    const QStringList parts = QString::fromStdString(uri).split(':');
    if (parts.size() < 3 || parts[0] != URI_SCHEME)
        throw InvalidReference("Invalid URI '{}'", uri);

    auto it = std::find_if(std::begin(kinds), std::end(kinds), [&](const auto &i){ return parts[1] == i.first; });
    if (it == std::end(kinds) || parts[2].isEmpty())
        return Reference {Kind::OTHER, uri};
    return Reference {it->second, parts[2].toStdString()};
}

std::string Reference::uri() const
{
    if (kind == Kind::OTHER)
        return id;
    return fmt::format(URI_SCHEME ":{}:{}", kind_name(kind), id);
}

const char* kind_name(Reference::Kind kind)
{
    switch (kind) {
        case Reference::Kind::TRACK:    return "track";
        case Reference::Kind::PLAYLIST: return "playlist";
        case Reference::Kind::ALBUM:    return "album";
        case Reference::Kind::ARTIST:   return "artist";
        default:                        return "other";
    }
}
