#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>

#include <taglib/mpegfile.h>
#include <taglib/id3v2.h>
#include <taglib/id3v2tag.h>

#include "tag.hpp"

class Id3Tag : public Tag {
    public:
        explicit Id3Tag(const std::filesystem::path &path);

        // ID3v2.3 unless enabled
        void use_id3v24(bool v) { version = v ? TagLib::ID3v2::Version::v4 : TagLib::ID3v2::Version::v3; }

        void set_separator(const std::string &separator) override { this->separator = separator; }
        void set_raw(const std::string &key, const std::vector<std::string> &values) override;
        void set_field(Field field, const std::vector<std::string> &values) override;
        void set_release_date(const std::string &date) override;
        void add_cover(const std::string &mime, const std::vector<char> &data) override;
        void add_unique_file_identifier(const std::string &track_id) override;
        void save() override;

    private:
        std::filesystem::path path;
        std::unique_ptr<TagLib::MPEG::File> file;

        // Owned by file
        TagLib::ID3v2::Tag *tag = nullptr;
        std::string separator;
        TagLib::ID3v2::Version version = TagLib::ID3v2::Version::v3;

        void set_text(const TagLib::ByteVector &frame_id, const std::string &value);
};
