#include <QByteArray>
#include <gtest/gtest.h>

#include "util.hpp"
#include "audio_fixtures.hpp"

TEST(Util, join)
{
    EXPECT_EQ(join({}, "; "), "");
    EXPECT_EQ(join({"a"}, "; "), "a");
    EXPECT_EQ(join({"a", "b", "c"}, "; "), "a; b; c");
}

TEST(Util, mime_from_image)
{
    EXPECT_EQ(mime_from_image(QByteArray("\xFF\xD8\xFF\xE0", 4)), "image/jpeg");
    EXPECT_EQ(mime_from_image(QByteArray("\x89PNG\r\n\x1a\n", 8)), "image/png");
    EXPECT_EQ(mime_from_image(QByteArray("GIF89a")), "");
    EXPECT_EQ(mime_from_image(QByteArray()), "");
}

TEST(Util, codec_from_name)
{
    EXPECT_EQ(codec_from_name("mp3"), Codec::MP3);
    EXPECT_EQ(codec_from_name("ogg"), Codec::VORBIS);
    EXPECT_EQ(codec_from_name("vorbis"), Codec::VORBIS);
    EXPECT_EQ(codec_from_name("flac"), Codec::NONE);
}

TEST(Util, codec_from_path)
{
    auto mp3 = make_mp3();
    EXPECT_EQ(codec_from_path(mp3->path()), Codec::MP3);

    // Missing files have no audio stream
    EXPECT_EQ(codec_from_path("missing.flac"), Codec::NONE);
    EXPECT_EQ(codec_from_path("missing"), Codec::NONE);
}
