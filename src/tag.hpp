#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <memory>
#include <filesystem>

#include <spdlog/logger.h>

#include "util.hpp"

#define UFID_OWNER "spotify.com"
#define COVER_DESCRIPTION "cover"

enum class Field {
    TITLE,
    ARTIST,
    ALBUM,
    TRACK_NUMBER,
    DISC_NUMBER,
    ALBUM_ARTIST,
    GENRE,
    LABEL
};

// ISO 8601 date/time prefix: YYYY[-MM[-DD[THH[:MM[:SS]]]]]
struct Timestamp {
    int year = 0;
    std::optional<int> month;
    std::optional<int> day;
    std::optional<int> hour;
    std::optional<int> minute;
    std::optional<int> second;

    std::string to_string() const;
    static std::optional<Timestamp> parse(std::string_view value);
};

// Tag container of one open audio file. Mutations stay in memory until save().
class Tag {
    public:
        virtual ~Tag() = default;
        virtual void set_separator(const std::string &separator) = 0;
        virtual void set_raw(const std::string &key, const std::vector<std::string> &values) = 0;
        virtual void set_field(Field field, const std::vector<std::string> &values) = 0;
        virtual void set_release_date(const std::string &date) = 0;
        virtual void add_cover(const std::string &mime, const std::vector<char> &data) = 0;
        virtual void add_unique_file_identifier(const std::string &track_id) = 0;
        virtual void save() = 0;
};

/* Owns the Tag implementation that matches the file's codec, chosen once when
*  the file is opened. Enforces the OPENED -> MUTATED -> SAVED lifecycle: saving
*  a second time is a no-op, mutating a saved tag throws std::logic_error.
*/
class TagWrap {
    public:
        enum class State {
            OPENED,
            MUTATED,
            SAVED
        };

        TagWrap(const std::filesystem::path &path, Codec codec, spdlog::logger &logger, int id3v2_version = 3);

        void set_separator(const std::string &separator);
        void set_raw(const std::string &key, const std::vector<std::string> &values);
        void set_field(Field field, const std::vector<std::string> &values);
        void set_release_date(const std::string &date);
        void add_cover(const std::string &mime, const std::vector<char> &data);
        void add_unique_file_identifier(const std::string &track_id);
        void save();

        State state() const { return current; }

    private:
        std::filesystem::path path;
        spdlog::logger &logger;
        std::unique_ptr<Tag> tag;
        State current = State::OPENED;

        void check_not_saved() const;
};
