#include <string>
#include <variant>

#include <gtest/gtest.h>
#include <QUrl>
#include <QUrlQuery>
#include <QJsonObject>
#include <QJsonArray>

#include "metadata_client.hpp"
#include "web_api.hpp"
#include "error.hpp"
#include "audio_fixtures.hpp"
#include "fake_web_api.hpp"

TEST(MetadataClient, resolves_track)
{
    FakeWebApi api;
    QJsonObject track = track_json("t1", "Song", 3);
    track["album"] = QJsonObject {{"id", "al1"}, {"name", "Record"}, {"release_date", "2020-05-01"}};
    api.responses["/tracks/t1"] = track;

    MetadataClient client(api, "SE", null_logger());
    const ResolvedItem item = client.resolve({Reference::Kind::TRACK, "t1"});
    ASSERT_TRUE(std::holds_alternative<Track>(item));
    const Track &result = std::get<Track>(item);
    EXPECT_EQ(result.name, "Song");
    EXPECT_EQ(result.track_number, 3);
    ASSERT_TRUE(result.album);
    EXPECT_EQ(result.album->name, "Record");

    ASSERT_EQ(api.requests.size(), 1);
    EXPECT_EQ(api.requests[0].query.queryItemValue("market"), "SE");
}

TEST(MetadataClient, dispatches_by_kind)
{
    FakeWebApi api;
    api.responses["/albums/al1"] = QJsonObject {
        {"id", "al1"}, {"name", "Record"}, {"label", "Label"},
        {"genres", QJsonArray {"rock", "pop"}},
        {"tracks", page_json({track_json("t1", "One")}, 0, 1, false)}
    };
    api.responses["/playlists/p1"] = QJsonObject {
        {"id", "p1"}, {"name", "Mix"}, {"owner", QJsonObject {{"display_name", "someone"}}},
        {"tracks", page_json({}, 0, 0, false)}
    };
    api.responses["/artists/ar1"] = QJsonObject {
        {"id", "ar1"}, {"name", "Band"}, {"followers", QJsonObject {{"total", 42}}}
    };

    MetadataClient client(api, "", null_logger());
    const ResolvedItem album = client.resolve({Reference::Kind::ALBUM, "al1"});
    ASSERT_TRUE(std::holds_alternative<Album>(album));
    EXPECT_EQ(std::get<Album>(album).label, "Label");
    ASSERT_EQ(std::get<Album>(album).tracks.size(), 1);
    ASSERT_TRUE(std::get<Album>(album).tracks[0].album);
    EXPECT_EQ(std::get<Album>(album).tracks[0].album->id, "al1");

    const ResolvedItem playlist = client.resolve({Reference::Kind::PLAYLIST, "p1"});
    ASSERT_TRUE(std::holds_alternative<Playlist>(playlist));
    EXPECT_EQ(std::get<Playlist>(playlist).owner, "someone");

    const ResolvedItem artist = client.resolve({Reference::Kind::ARTIST, "ar1"});
    ASSERT_TRUE(std::holds_alternative<Artist>(artist));
    EXPECT_EQ(std::get<Artist>(artist).followers, 42);
}

TEST(MetadataClient, no_market_when_empty)
{
    FakeWebApi api;
    api.responses["/tracks/t1"] = track_json("t1", "Song");
    MetadataClient client(api, "", null_logger());
    client.track("t1");
    ASSERT_EQ(api.requests.size(), 1);
    EXPECT_FALSE(api.requests[0].query.hasQueryItem("market"));
}

TEST(MetadataClient, artist_request_has_no_market)
{
    FakeWebApi api;
    api.responses["/artists/ar1"] = QJsonObject {{"id", "ar1"}, {"name", "Band"}};
    MetadataClient client(api, "US", null_logger());
    client.artist("ar1");
    ASSERT_EQ(api.requests.size(), 1);
    EXPECT_TRUE(api.requests[0].query.isEmpty());
}

TEST(MetadataClient, other_makes_no_request)
{
    FakeWebApi api;
    MetadataClient client(api, "US", null_logger());
    const ResolvedItem item = client.resolve(Reference::from_uri("spotify:show:abc"));
    ASSERT_TRUE(std::holds_alternative<Other>(item));
    EXPECT_EQ(std::get<Other>(item).uri, "spotify:show:abc");
    EXPECT_TRUE(api.requests.empty());
}

TEST(MetadataClient, search)
{
    FakeWebApi api;
    api.responses["/search"] = QJsonObject {
        {"tracks", page_json({track_json("t1", "One"), track_json("t2", "Two")}, 0, 2, false)}
    };
    MetadataClient client(api, "DE", null_logger());
    const std::vector<Track> tracks = client.search("artist:Band one");
    ASSERT_EQ(tracks.size(), 2);
    EXPECT_EQ(tracks[1].id, "t2");

    const QUrlQuery &query = api.requests.at(0).query;
    EXPECT_EQ(query.queryItemValue("q", QUrl::FullyDecoded), "artist:Band one");
    EXPECT_EQ(query.queryItemValue("type"), "track");
    EXPECT_EQ(query.queryItemValue("limit"), "50");
    EXPECT_EQ(query.queryItemValue("offset"), "0");
    EXPECT_EQ(query.queryItemValue("include_external"), "audio");
    EXPECT_EQ(query.queryItemValue("market"), "DE");
}

TEST(MetadataClient, search_keeps_plus_signs)
{
    FakeWebApi api;
    api.responses["/search"] = QJsonObject {{"tracks", page_json({}, 0, 0, false)}};
    MetadataClient client(api, "", null_logger());
    client.search("AC+DC");

    const QUrlQuery &query = api.requests.at(0).query;
    EXPECT_EQ(query.queryItemValue("q", QUrl::FullyDecoded), "AC+DC");
    const QString encoded = query.toString(QUrl::FullyEncoded);
    EXPECT_TRUE(encoded.contains("q=AC%2BDC")) << encoded.toStdString();
    EXPECT_FALSE(encoded.contains("AC+DC")) << encoded.toStdString();
}

TEST(MetadataClient, search_without_tracks_is_empty)
{
    FakeWebApi api;
    api.responses["/search"] = QJsonObject {};
    MetadataClient client(api, "", null_logger());
    EXPECT_TRUE(client.search("nothing").empty());
}

TEST(MetadataClient, remote_failure_propagates)
{
    FakeWebApi api;
    api.failing.insert("/tracks/t1");
    MetadataClient client(api, "", null_logger());
    try {
        client.track("t1");
        FAIL() << "expected RemoteServiceError";
    }
    catch (const RemoteServiceError &e) {
        EXPECT_EQ(e.status(), 500);
    }
}

TEST(MetadataClient, malformed_response)
{
    FakeWebApi api;
    api.responses["/tracks/t1"] = QJsonObject {{"id", "t1"}};
    MetadataClient client(api, "", null_logger());
    EXPECT_THROW(client.track("t1"), RemoteServiceError);
}

TEST(MetadataClient, error_message)
{
    EXPECT_EQ(SpotifyWebApi::error_message(R"({"error":{"status":404,"message":"Non existing id"}})"), "Non existing id");
    EXPECT_EQ(SpotifyWebApi::error_message(R"({"error":"invalid_client","error_description":"Invalid client"})"), "Invalid client");
    EXPECT_EQ(SpotifyWebApi::error_message("not json"), "");
}
