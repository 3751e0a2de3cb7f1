#pragma once

#include <string>

#define URI_SCHEME "spotify"
#define WEB_PLAYER_HOST "open.spotify.com"

struct Reference {
    enum class Kind {
        TRACK,
        PLAYLIST,
        ALBUM,
        ARTIST,
        OTHER
    };

    const Kind kind;

    // For OTHER this holds the full original input instead of an id
    const std::string id;

    std::string uri() const;
    static Reference from_uri(const std::string &uri);
};

const char* kind_name(Reference::Kind kind);

// Normalize a native URI or a web player URL to "spotify:<kind>:<id>".
// Throws InvalidReference.
std::string parse_uri(const std::string &input);
Reference resolve_reference(const std::string &input);
