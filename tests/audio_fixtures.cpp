#include <string>
#include <vector>
#include <memory>
#include <random>
#include <fstream>
#include <cstdint>
#include <filesystem>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

#include "audio_fixtures.hpp"

using Bytes = std::vector<uint8_t>;

TemporaryFile::TemporaryFile(const std::string &extension)
{
    static std::mt19937_64 rng(std::random_device{}());
    file_path = std::filesystem::temp_directory_path() / fmt::format("spottag-test-{:016x}{}", rng(), extension);
}

TemporaryFile::~TemporaryFile()
{
    std::error_code ec;
    std::filesystem::remove(file_path, ec);
}

static void write_file(const std::filesystem::path &path, const Bytes &data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out)
        throw std::runtime_error(fmt::format("Could not write fixture '{}'", path.string()));
}

static void put_le(Bytes &out, uint64_t value, int size)
{
    for (int i = 0; i < size; i++)
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
}

static void put_string(Bytes &out, const std::string &s)
{
    out.insert(out.end(), s.begin(), s.end());
}

std::unique_ptr<TemporaryFile> make_mp3()
{
    // 128 kbit/s, 44.1 kHz, no padding, no CRC: 417 bytes per frame
    constexpr int FRAME_SIZE = 417;
    constexpr int FRAMES = 10;
    Bytes data;
    for (int i = 0; i < FRAMES; i++) {
        data.insert(data.end(), {0xFF, 0xFB, 0x90, 0x64});
        data.resize(data.size() + FRAME_SIZE - 4, 0);
    }
    auto file = std::make_unique<TemporaryFile>(".mp3");
    write_file(file->path(), data);
    return file;
}

static uint32_t ogg_crc(const Bytes &page)
{
    static const auto table = []{
        std::vector<uint32_t> t(256);
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t r = i << 24;
            for (int j = 0; j < 8; j++)
                r = (r & 0x80000000) ? (r << 1) ^ 0x04C11DB7 : r << 1;
            t[i] = r;
        }
        return t;
    }();
    uint32_t crc = 0;
    for (uint8_t b : page)
        crc = (crc << 8) ^ table[((crc >> 24) ^ b) & 0xFF];
    return crc;
}

// One packet per page, every packet shorter than 255 bytes
static Bytes ogg_page(const Bytes &packet, uint8_t flags, uint64_t granule, uint32_t sequence)
{
    constexpr uint32_t SERIAL = 0x5350544E;
    Bytes page;
    put_string(page, "OggS");
    page.push_back(0);
    page.push_back(flags);
    put_le(page, granule, 8);
    put_le(page, SERIAL, 4);
    put_le(page, sequence, 4);
    put_le(page, 0, 4);
    page.push_back(1);
    page.push_back(static_cast<uint8_t>(packet.size()));
    page.insert(page.end(), packet.begin(), packet.end());

    const uint32_t crc = ogg_crc(page);
    for (int i = 0; i < 4; i++)
        page[22 + i] = static_cast<uint8_t>(crc >> (8 * i));
    return page;
}

std::unique_ptr<TemporaryFile> make_ogg_vorbis()
{
    Bytes identification {0x01};
    put_string(identification, "vorbis");
    put_le(identification, 0, 4);          // version
    identification.push_back(2);           // channels
    put_le(identification, 44100, 4);      // sample rate
    put_le(identification, 0, 4);          // maximum bitrate
    put_le(identification, 128000, 4);     // nominal bitrate
    put_le(identification, 0, 4);          // minimum bitrate
    identification.push_back(0xB8);        // block sizes 256 and 2048
    identification.push_back(1);           // framing

    const std::string vendor = "spottag test";
    Bytes comment {0x03};
    put_string(comment, "vorbis");
    put_le(comment, vendor.size(), 4);
    put_string(comment, vendor);
    put_le(comment, 0, 4);
    comment.push_back(1);

    Bytes setup {0x05};
    put_string(setup, "vorbis");
    setup.resize(setup.size() + 32, 0);

    const Bytes audio(16, 0);

    Bytes data;
    for (const Bytes &page : {
            ogg_page(identification, 0x02, 0, 0),
            ogg_page(comment, 0x00, 0, 1),
            ogg_page(setup, 0x00, 0, 2),
            ogg_page(audio, 0x04, 11025, 3)
        })
        data.insert(data.end(), page.begin(), page.end());

    auto file = std::make_unique<TemporaryFile>(".ogg");
    write_file(file->path(), data);
    return file;
}

spdlog::logger& null_logger()
{
    static spdlog::logger logger("null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}
