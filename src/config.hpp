#pragma once

#include <string>
#include <vector>
#include <utility>
#include <algorithm>
#include <cassert>

#include <QString>
#include <QSettings>
#include <spdlog/spdlog.h>

#define DEFAULT_SEPARATOR "; "

struct Config {
    template <typename T>
    class ComboMap {
        public:
            const QString& get_current_key() const { return current->first; }
            const T& get_current_value() const { return current->second; }
            bool set(const QString &key) {
                if (key.isEmpty())
                    return false;
                auto it = find(key);
                if (it == map.end())
                    return false;
                current = it;
                return true;
            }
            ComboMap(const std::vector<std::pair<QString, T>> &&map, const QString &initial)
            : map(map), current(find(initial)) { assert(current != this->map.end()); }
            ComboMap(const ComboMap &o) : map(o.map), current(map.begin() + (o.current - o.map.begin())) {}
            ComboMap& operator=(const ComboMap &o) {
                map = o.map;
                current = map.begin() + (o.current - o.map.begin());
                return *this;
            }

        private:
            std::vector<std::pair<QString, T>> map;
            typename std::vector<std::pair<QString, T>>::iterator current;
            typename std::vector<std::pair<QString, T>>::iterator find(const QString &key) {
                return std::find_if(map.begin(), map.end(), [&](const auto &i) { return key == i.first; });
            }
    };

    ComboMap<spdlog::level::level_enum> log_level {
        {
            {"error", spdlog::level::err},
            {"info",  spdlog::level::info},
            {"debug", spdlog::level::debug},
        },
        "error"
    };

    ComboMap<int> id3v2_version {
        {
            {"3", 3},
            {"4", 4},
        },
        "3"
    };

    std::string client_id;
    std::string client_secret;

    // Empty for no market restriction
    std::string market;
    std::string separator = DEFAULT_SEPARATOR;
    bool embed_cover = true;
    std::string log_file;

    void load(const QSettings &settings);
    bool set_market(const QString &code);
    spdlog::level::level_enum get_log_level() const { return log_level.get_current_value(); }
    int get_id3v2_version() const { return id3v2_version.get_current_value(); }
};
