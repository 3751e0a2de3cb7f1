#pragma once

#include <string>

#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <spdlog/logger.h>

#define API_BASE_URL "https://api.spotify.com/v1"
#define TOKEN_URL "https://accounts.spotify.com/api/token"

class QNetworkRequest;
class QNetworkReply;

// Request/response transport to the catalog service. Each call completes (or
// throws RemoteServiceError) before returning.
class WebApi {
    public:
        virtual ~WebApi() = default;
        virtual QJsonObject get(const QString &endpoint, const QUrlQuery &query) = 0;
        virtual QByteArray download(const QUrl &url) = 0;
};

class SpotifyWebApi : public WebApi {
    public:
        SpotifyWebApi(const std::string &client_id, const std::string &client_secret, spdlog::logger &logger)
        : client_id(client_id), client_secret(client_secret), logger(logger) {}
        QJsonObject get(const QString &endpoint, const QUrlQuery &query) override;
        QByteArray download(const QUrl &url) override;

        // Message of an error response body, or an empty string
        static std::string error_message(const QByteArray &body);

    private:
        std::string client_id;
        std::string client_secret;
        spdlog::logger &logger;
        QNetworkAccessManager manager;
        QByteArray token;
        QDateTime token_expiry;

        void request_token();
        QByteArray wait(QNetworkReply *reply, const QUrl &url);
};
