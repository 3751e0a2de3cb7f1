#pragma once

#include <string>
#include <memory>
#include <filesystem>

#include <spdlog/logger.h>

// Minimal untagged audio files, written to a unique temporary path and removed on destruction
class TemporaryFile {
    public:
        explicit TemporaryFile(const std::string &extension);
        ~TemporaryFile();
        TemporaryFile(const TemporaryFile&) = delete;
        TemporaryFile& operator=(const TemporaryFile&) = delete;

        const std::filesystem::path& path() const { return file_path; }

    private:
        std::filesystem::path file_path;
};

// About a quarter second of silent MPEG-1 Layer III frames
std::unique_ptr<TemporaryFile> make_mp3();

// Ogg Vorbis stream with identification, empty comment and setup headers
std::unique_ptr<TemporaryFile> make_ogg_vorbis();

// Logger that discards everything
spdlog::logger& null_logger();
