#include <string>
#include <string_view>
#include <algorithm>
#include <filesystem>
#include <vector>
#include <string.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}
#include <QByteArray>

#include "util.hpp"

// MP3 is trusted by extension, anything else is opened with libavformat
Codec codec_from_path(const std::filesystem::path &path)
{
    std::string ext(path.extension().string());
    std::transform(ext.begin(), ext.end(), ext.begin(), tolower);
    if (ext == ".mp3")
        return Codec::MP3;

    switch (ffcodec_from_file(path)) {
        case AV_CODEC_ID_NONE:   return Codec::NONE;
        case AV_CODEC_ID_MP3:    return Codec::MP3;
        case AV_CODEC_ID_VORBIS: return Codec::VORBIS;
        default:                 return Codec::OTHER;
    }
}

Codec codec_from_name(std::string_view name)
{
    if (name == "mp3")
        return Codec::MP3;
    if (name == "vorbis" || name == "ogg")
        return Codec::VORBIS;
    return Codec::NONE;
}

// Codec of the best audio stream, AV_CODEC_ID_NONE if the file cannot be opened
AVCodecID ffcodec_from_file(const std::filesystem::path &path)
{
    AVFormatContext *fmt_ctx = nullptr;
    if (avformat_open_input(&fmt_ctx, path.string().c_str(), nullptr, nullptr) < 0)
        return AV_CODEC_ID_NONE;

    AVCodecID codec_id = AV_CODEC_ID_NONE;
    if (avformat_find_stream_info(fmt_ctx, nullptr) >= 0) {
        const int stream = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
        if (stream >= 0)
            codec_id = fmt_ctx->streams[stream]->codecpar->codec_id;
    }
    avformat_close_input(&fmt_ctx);
    return codec_id;
}

const char* codec_name(Codec codec)
{
    switch (codec) {
        case Codec::MP3:    return "MP3";
        case Codec::VORBIS: return "Vorbis";
        case Codec::OTHER:  return "other";
        default:            return "unknown";
    }
}

// Sniff the image type from its magic bytes
std::string mime_from_image(const QByteArray &data)
{
    if (data.size() >= 3 && !strncmp(data.constData(), "\xFF\xD8\xFF", 3))
        return "image/jpeg";
    if (data.size() >= 4 && !strncmp(data.constData(), "\x89\x50\x4E\x47", 4))
        return "image/png";
    return std::string();
}

std::string join(const std::vector<std::string> &values, const std::string &separator)
{
    std::string ret;
    for (auto it = values.begin(); it != values.end(); ++it) {
        if (it != values.begin())
            ret += separator;
        ret += *it;
    }
    return ret;
}
