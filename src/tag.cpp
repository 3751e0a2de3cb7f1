#include <string>
#include <string_view>
#include <optional>
#include <memory>
#include <stdexcept>
#include <charconv>
#include <filesystem>

#include <fmt/core.h>
#include <spdlog/logger.h>

#include "tag.hpp"
#include "id3_tag.hpp"
#include "ogg_tag.hpp"
#include "error.hpp"

static bool parse_component(std::string_view value, size_t pos, size_t len, int min, int max, int &out)
{
    if (value.size() < pos + len)
        return false;
    const char *begin = value.data() + pos;
    const char *end = begin + len;
    for (const char *c = begin; c != end; c++) {
        if (*c < '0' || *c > '9')
            return false;
    }
    std::from_chars(begin, end, out);
    return out >= min && out <= max;
}

static int days_in_month(int year, int month)
{
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0))
        return 29;
    return days[month - 1];
}

std::optional<Timestamp> Timestamp::parse(std::string_view value)
{
    Timestamp ts;
    int n = 0;

    // Year
    if (!parse_component(value, 0, 4, 0, 9999, ts.year))
        return std::nullopt;
    if (value.size() == 4)
        return ts;

    // Month
    if (value[4] != '-' || !parse_component(value, 5, 2, 1, 12, n))
        return std::nullopt;
    ts.month = n;
    if (value.size() == 7)
        return ts;

    // Day
    if (value[7] != '-' || !parse_component(value, 8, 2, 1, days_in_month(ts.year, *ts.month), n))
        return std::nullopt;
    ts.day = n;
    if (value.size() == 10)
        return ts;

    // Time
    if ((value[10] != 'T' && value[10] != ' ') || !parse_component(value, 11, 2, 0, 23, n))
        return std::nullopt;
    ts.hour = n;
    if (value.size() == 13)
        return ts;
    if (value[13] != ':' || !parse_component(value, 14, 2, 0, 59, n))
        return std::nullopt;
    ts.minute = n;
    if (value.size() == 16)
        return ts;
    if (value[16] != ':' || !parse_component(value, 17, 2, 0, 59, n))
        return std::nullopt;
    ts.second = n;
    return value.size() == 19 ? std::optional<Timestamp>(ts) : std::nullopt;
}

std::string Timestamp::to_string() const
{
    std::string ret = fmt::format("{:04d}", year);
    if (month) {
        ret += fmt::format("-{:02d}", *month);
        if (day) {
            ret += fmt::format("-{:02d}", *day);
            if (hour) {
                ret += fmt::format("T{:02d}", *hour);
                if (minute) {
                    ret += fmt::format(":{:02d}", *minute);
                    if (second)
                        ret += fmt::format(":{:02d}", *second);
                }
            }
        }
    }
    return ret;
}

TagWrap::TagWrap(const std::filesystem::path &path, Codec codec, spdlog::logger &logger, int id3v2_version)
: path(path), logger(logger)
{
    switch (codec) {
        case Codec::MP3: {
            auto id3 = std::make_unique<Id3Tag>(path);
            id3->use_id3v24(id3v2_version == 4);
            tag = std::move(id3);
            break;
        }

        case Codec::VORBIS:
            tag = std::make_unique<OggTag>(path);
            break;

        default:
            throw UnsupportedFormat("Cannot tag '{}': unsupported format {}", path.string(), codec_name(codec));
    }
    logger.debug("Opened '{}' for tagging ({})", path.string(), codec_name(codec));
}

void TagWrap::check_not_saved() const
{
    if (current == State::SAVED)
        throw std::logic_error(fmt::format("Tag of '{}' has already been saved", path.string()));
}

void TagWrap::set_separator(const std::string &separator)
{
    check_not_saved();
    tag->set_separator(separator);
}

void TagWrap::set_raw(const std::string &key, const std::vector<std::string> &values)
{
    check_not_saved();
    tag->set_raw(key, values);
    current = State::MUTATED;
}

void TagWrap::set_field(Field field, const std::vector<std::string> &values)
{
    check_not_saved();
    tag->set_field(field, values);
    current = State::MUTATED;
}

void TagWrap::set_release_date(const std::string &date)
{
    check_not_saved();
    tag->set_release_date(date);
    current = State::MUTATED;
}

void TagWrap::add_cover(const std::string &mime, const std::vector<char> &data)
{
    check_not_saved();
    tag->add_cover(mime, data);
    current = State::MUTATED;
}

void TagWrap::add_unique_file_identifier(const std::string &track_id)
{
    check_not_saved();
    tag->add_unique_file_identifier(track_id);
    current = State::MUTATED;
}

void TagWrap::save()
{
    if (current == State::SAVED) {
        logger.debug("Tag of '{}' already saved, nothing to do", path.string());
        return;
    }
    tag->save();
    current = State::SAVED;
    logger.info("Saved tags to '{}'", path.string());
}
