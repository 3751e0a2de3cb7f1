#include <string>
#include <memory>

#include <QEventLoop>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QUrlQuery>
#include <QDateTime>
#include <spdlog/logger.h>

#include "web_api.hpp"
#include "error.hpp"

// Refresh the token a little before the service expires it
#define TOKEN_MARGIN 60

QJsonObject SpotifyWebApi::get(const QString &endpoint, const QUrlQuery &query)
{
    if (token.isEmpty() || QDateTime::currentDateTimeUtc() >= token_expiry)
        request_token();

    QUrl url(QStringLiteral(API_BASE_URL) + endpoint);
    url.setQuery(query);
    logger.debug("GET {}", url.toString().toStdString());
    QNetworkRequest request(url);
    request.setRawHeader("Authorization", "Bearer " + token);
    request.setRawHeader("Accept", "application/json");

    const QByteArray body = wait(manager.get(request), url);
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &error);
    if (error.error != QJsonParseError::NoError)
        throw RemoteServiceError("Invalid JSON from '{}': {}", url.toString().toStdString(), error.errorString().toStdString());
    if (!doc.isObject())
        throw RemoteServiceError("Unexpected response from '{}'", url.toString().toStdString());
    return doc.object();
}

QByteArray SpotifyWebApi::download(const QUrl &url)
{
    logger.debug("Downloading {}", url.toString().toStdString());
    return wait(manager.get(QNetworkRequest(url)), url);
}

void SpotifyWebApi::request_token()
{
    if (client_id.empty() || client_secret.empty())
        throw RemoteServiceError("Client credentials are not configured");

    logger.debug("Requesting access token");
    const QUrl url(TOKEN_URL);
    QNetworkRequest request(url);
    const QByteArray credentials = QByteArray::fromStdString(client_id + ":" + client_secret).toBase64();
    request.setRawHeader("Authorization", "Basic " + credentials);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/x-www-form-urlencoded");

    QUrlQuery form;
    form.addQueryItem("grant_type", "client_credentials");
    const QByteArray body = wait(manager.post(request, form.toString(QUrl::FullyEncoded).toUtf8()), url);

    const QJsonObject json = QJsonDocument::fromJson(body).object();
    const QString access_token = json.value("access_token").toString();
    if (access_token.isEmpty())
        throw RemoteServiceError("Authentication failed: no access token in response");
    token = access_token.toUtf8();
    const int expires_in = json.value("expires_in").toInt(3600);
    token_expiry = QDateTime::currentDateTimeUtc().addSecs(expires_in > TOKEN_MARGIN ? expires_in - TOKEN_MARGIN : expires_in);
}

// Block on a local event loop until the reply has finished
QByteArray SpotifyWebApi::wait(QNetworkReply *reply, const QUrl &url)
{
    std::unique_ptr<QNetworkReply, void(*)(QNetworkReply*)> guard(reply, [](QNetworkReply *r){ r->deleteLater(); });
    if (!reply->isFinished()) {
        QEventLoop loop;
        QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray body = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        std::string message = error_message(body);
        if (message.empty())
            message = reply->errorString().toStdString();
        logger.error("Request to '{}' failed ({}): {}", url.toString().toStdString(), status, message);
        throw RemoteServiceError(status, "Request to '{}' failed: {}", url.toString().toStdString(), message);
    }
    return body;
}

std::string SpotifyWebApi::error_message(const QByteArray &body)
{
    const QJsonObject json = QJsonDocument::fromJson(body).object();
    const QJsonValue error = json.value("error");

    // The token endpoint returns {"error": "...", "error_description": "..."}
    if (error.isString()) {
        const QString description = json.value("error_description").toString();
        return (description.isEmpty() ? error.toString() : description).toStdString();
    }
    return error.toObject().value("message").toString().toStdString();
}
