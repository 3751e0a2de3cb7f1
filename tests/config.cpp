#include <QSettings>
#include <QString>
#include <gtest/gtest.h>

#include "config.hpp"
#include "audio_fixtures.hpp"

TEST(Config, defaults)
{
    Config config;
    EXPECT_EQ(config.separator, DEFAULT_SEPARATOR);
    EXPECT_TRUE(config.market.empty());
    EXPECT_TRUE(config.embed_cover);
    EXPECT_EQ(config.get_id3v2_version(), 3);
    EXPECT_EQ(config.get_log_level(), spdlog::level::err);
}

TEST(Config, load)
{
    TemporaryFile ini(".ini");
    {
        QSettings settings(QString::fromStdString(ini.path().string()), QSettings::IniFormat);
        settings.setValue("client_id", "id");
        settings.setValue("client_secret", "secret");
        settings.setValue("market", "se");
        settings.setValue("separator", " / ");
        settings.setValue("id3v2_version", "4");
        settings.setValue("embed_cover", false);
        settings.setValue("log_level", "debug");
        settings.setValue("log_file", "/tmp/spottag.log");
    }

    Config config;
    config.load(QSettings(QString::fromStdString(ini.path().string()), QSettings::IniFormat));
    EXPECT_EQ(config.client_id, "id");
    EXPECT_EQ(config.client_secret, "secret");
    EXPECT_EQ(config.market, "SE");
    EXPECT_EQ(config.separator, " / ");
    EXPECT_EQ(config.get_id3v2_version(), 4);
    EXPECT_FALSE(config.embed_cover);
    EXPECT_EQ(config.get_log_level(), spdlog::level::debug);
    EXPECT_EQ(config.log_file, "/tmp/spottag.log");
}

TEST(Config, invalid_values_keep_defaults)
{
    TemporaryFile ini(".ini");
    {
        QSettings settings(QString::fromStdString(ini.path().string()), QSettings::IniFormat);
        settings.setValue("market", "Sweden");
        settings.setValue("id3v2_version", "2");
        settings.setValue("log_level", "verbose");
    }

    Config config;
    config.load(QSettings(QString::fromStdString(ini.path().string()), QSettings::IniFormat));
    EXPECT_TRUE(config.market.empty());
    EXPECT_EQ(config.get_id3v2_version(), 3);
    EXPECT_EQ(config.get_log_level(), spdlog::level::err);
    EXPECT_EQ(config.separator, DEFAULT_SEPARATOR);
}

TEST(Config, market)
{
    Config config;
    EXPECT_TRUE(config.set_market("us"));
    EXPECT_EQ(config.market, "US");
    EXPECT_FALSE(config.set_market("U1"));
    EXPECT_FALSE(config.set_market("USA"));
    EXPECT_EQ(config.market, "US");
}

TEST(Config, copy_keeps_selection)
{
    Config config;
    config.id3v2_version.set("4");
    const Config copy = config;
    EXPECT_EQ(copy.get_id3v2_version(), 4);
    EXPECT_EQ(copy.id3v2_version.get_current_key(), "4");
}

TEST(Config, combo_map_keys_and_values)
{
    Config::ComboMap<int> map({{"low", 1}, {"high", 2}}, "low");
    EXPECT_EQ(map.get_current_key(), "low");
    EXPECT_EQ(map.get_current_value(), 1);
    EXPECT_TRUE(map.set("high"));
    EXPECT_EQ(map.get_current_value(), 2);
    EXPECT_FALSE(map.set("medium"));
    EXPECT_FALSE(map.set(""));
    EXPECT_EQ(map.get_current_key(), "high");

    Config config;
    EXPECT_TRUE(config.log_level.set("debug"));
    EXPECT_EQ(config.get_log_level(), spdlog::level::debug);
    EXPECT_FALSE(config.log_level.set("Every request and tag"));
}
