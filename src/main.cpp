#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include <utility>

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QSettings>
#include <QUrl>
#include <QByteArray>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
extern "C" {
#include <libavutil/log.h>
}

#include "main.hpp"
#include "config.hpp"
#include "error.hpp"
#include "uri.hpp"
#include "web_api.hpp"
#include "metadata_client.hpp"
#include "catalog_expander.hpp"
#include "tagger.hpp"
#include "util.hpp"
#include <spottag.hpp>

#define LOG_PATTERN "[%Y-%m-%d %H:%M:%S.%e] [%l] %v"

Application::Application(const Config &config, std::shared_ptr<spdlog::logger> logger)
: config(config), logger(std::move(logger)) {}

Application::~Application() = default;

void Application::connect()
{
    if (client)
        return;
    if (config.client_id.empty() || config.client_secret.empty())
        throw RemoteServiceError("No client credentials configured, set client_id and client_secret");
    api = std::make_unique<SpotifyWebApi>(config.client_id, config.client_secret, *logger);
    client = std::make_unique<MetadataClient>(*api, config.market, *logger);
}

int Application::run(const QStringList &args)
{
    const QString command = args.value(0);
    const qsizetype expected = command == "tag" ? 3 : 2;
    if (args.size() != expected) {
        fmt::print(stderr, "Usage: {} [options] <resolve|list|search|tag> <args>\n", EXECUTABLE_NAME);
        return EXIT_USAGE;
    }

    try {
        if (command == "resolve")
            resolve(args[1].toStdString());
        else if (command == "list")
            list(args[1].toStdString());
        else if (command == "search")
            search(args[1].toStdString());
        else if (command == "tag")
            tag(args[1].toStdString(), args[2].toStdString());
        else {
            fmt::print(stderr, "Unknown command '{}'\n", command.toStdString());
            return EXIT_USAGE;
        }
    }
    catch (const InvalidReference &e) {
        logger->error("{}", e.what());
        return EXIT_INVALID_REFERENCE;
    }
    catch (const RemoteServiceError &e) {
        if (e.status())
            logger->error("{} (HTTP {})", e.what(), e.status());
        else
            logger->error("{}", e.what());
        return EXIT_REMOTE;
    }
    catch (const UnsupportedFormat &e) {
        logger->error("{}", e.what());
        return EXIT_TAGGING;
    }
    catch (const TagEncodingError &e) {
        logger->error("{}", e.what());
        return EXIT_TAGGING;
    }
    return EXIT_OK;
}

void Application::resolve(const std::string &input)
{
    const Reference reference = resolve_reference(input);
    logger->info("Resolved '{}' to {}", input, reference.uri());
    connect();
    fmt::print("{}\n", describe(client->resolve(reference)));
}

void Application::list(const std::string &input)
{
    const Reference reference = resolve_reference(input);
    connect();
    CatalogExpander expander(*client);
    const std::vector<Track> tracks = expander.expand(reference);
    int n = 0;
    for (const auto &track : tracks)
        fmt::print("{:>4}. {} - {}  {}\n", ++n, join(track.artist_names(), ", "), track.name, track.uri());
    logger->info("{} tracks", tracks.size());
}

void Application::search(const std::string &query)
{
    connect();
    for (const auto &track : client->search(query)) {
        fmt::print("{} - {}{}  {}\n", join(track.artist_names(), ", "), track.name,
                   track.album ? fmt::format(" [{}]", track.album->name) : "", track.uri());
    }
}

void Application::tag(const std::string &input, const std::string &file)
{
    const Reference reference = resolve_reference(input);
    if (reference.kind != Reference::Kind::TRACK)
        throw InvalidReference("'{}' is a {}, not a track", input, kind_name(reference.kind));

    const std::filesystem::path path(file);
    if (!std::filesystem::is_regular_file(path))
        throw TagEncodingError("No such file '{}'", file);
    const Codec codec = format.empty() ? codec_from_path(path) : codec_from_name(format);
    logger->info("Using codec {} for '{}'", codec_name(codec), file);
    if (codec == Codec::NONE)
        throw UnsupportedFormat("Cannot tag '{}': not an audio file", file);
    if (codec == Codec::OTHER)
        throw UnsupportedFormat("Cannot tag '{}': {} audio is not supported", file, avcodec_get_name(ffcodec_from_file(path)));

    connect();
    const Track track = client->track(reference.id);
    std::optional<Album> album;
    if (track.album && !track.album->id.empty())
        album = client->album(track.album->id);

    QByteArray cover;
    const AlbumRef *ref = album ? &*album : (track.album ? &*track.album : nullptr);
    if (config.embed_cover && ref && ref->cover()) {
        try {
            cover = api->download(QUrl(QString::fromStdString(ref->cover()->url)));
        }
        catch (const RemoteServiceError &e) {
            logger->warn("Could not download cover art, tagging without it: {}", e.what());
        }
    }

    Tagger tagger(config, *logger);
    tagger.write(path, codec, track, album, cover);
    fmt::print("Tagged '{}' with {}\n", file, describe(track));
}

static std::shared_ptr<spdlog::logger> make_logger(const Config &config)
{
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(LOG_PATTERN);
    auto logger = std::make_shared<spdlog::logger>(EXECUTABLE_NAME, console_sink);
    if (!config.log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, true);
            file_sink->set_pattern(LOG_PATTERN);
            logger->sinks().push_back(file_sink);
        }
        catch (const spdlog::spdlog_ex &e) {
            logger->warn("Could not open log file '{}': {}", config.log_file, e.what());
        }
    }
    spdlog::level::level_enum level = config.get_log_level();
    logger->set_level(level);
    logger->flush_on(level == spdlog::level::debug ? spdlog::level::debug : spdlog::level::err);
    return logger;
}

int main(int argc, char *argv[])
{
#ifndef FFDEBUG
    av_log_set_callback(nullptr);
#endif

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(EXECUTABLE_NAME);
    QCoreApplication::setApplicationVersion(PROJECT_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription(PROJECT_NAME " - tag local audio files from the Spotify catalog");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "resolve <uri>, list <uri>, search <query> or tag <uri> <file>");
    parser.addOptions({
        {"config", "Read settings from the INI file <path>.", "path"},
        {"market", "Restrict results to the ISO 3166-1 country <code>.", "code"},
        {"separator", "Join multiple values with <text>.", "text"},
        {"id3v24", "Write ID3v2.4 instead of ID3v2.3."},
        {"no-cover", "Do not embed cover art."},
        {"format", "Treat the file as <codec> instead of detecting it (mp3, vorbis).", "codec"},
        {"verbose", "Log every request and tag."}
    });
    parser.process(app);

    Config config;
    if (parser.isSet("config"))
        config.load(QSettings(parser.value("config"), QSettings::IniFormat));
    else
        config.load(QSettings(EXECUTABLE_NAME, EXECUTABLE_NAME));

    if (parser.isSet("market") && !config.set_market(parser.value("market"))) {
        fmt::print(stderr, "Invalid market '{}', expected a two letter country code\n", parser.value("market").toStdString());
        return EXIT_USAGE;
    }
    if (parser.isSet("separator"))
        config.separator = parser.value("separator").toStdString();
    if (parser.isSet("id3v24"))
        config.id3v2_version.set("4");
    if (parser.isSet("no-cover"))
        config.embed_cover = false;
    if (parser.isSet("verbose"))
        config.log_level.set("debug");

    Application application(config, make_logger(config));
    if (parser.isSet("format"))
        application.set_format(parser.value("format").toLower().toStdString());
    return application.run(parser.positionalArguments());
}
