#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>

#include <taglib/vorbisfile.h>
#include <taglib/xiphcomment.h>

#include "tag.hpp"

// Vorbis comment counterpart of the ID3 UFID frame
#define UFID_VORBIS_KEY "SPOTIFY_TRACKID"

class OggTag : public Tag {
    public:
        explicit OggTag(const std::filesystem::path &path);

        void set_separator(const std::string &separator) override { this->separator = separator; }
        void set_raw(const std::string &key, const std::vector<std::string> &values) override;
        void set_field(Field field, const std::vector<std::string> &values) override;
        void set_release_date(const std::string &date) override;
        void add_cover(const std::string &mime, const std::vector<char> &data) override;
        void add_unique_file_identifier(const std::string &track_id) override;
        void save() override;

    private:
        std::filesystem::path path;
        std::unique_ptr<TagLib::Ogg::Vorbis::File> file;

        // Owned by file
        TagLib::Ogg::XiphComment *tag = nullptr;
        std::string separator;
};
