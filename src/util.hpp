#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

#include <QByteArray>

extern "C" {
#include "libavcodec/avcodec.h"
}

// NONE: not an audio file. OTHER: audio in a codec that cannot be tagged.
enum class Codec {
    NONE = -1,
    MP3,
    VORBIS,
    OTHER
};

Codec codec_from_path(const std::filesystem::path &path);
Codec codec_from_name(std::string_view name);
AVCodecID ffcodec_from_file(const std::filesystem::path &path);
const char* codec_name(Codec codec);
std::string mime_from_image(const QByteArray &data);
std::string join(const std::vector<std::string> &values, const std::string &separator);
