#include <string>
#include <algorithm>

#include <QSettings>
#include <QString>

#include "config.hpp"

void Config::load(const QSettings &settings)
{
    // Web API
    client_id = settings.value("client_id", QString::fromStdString(client_id)).toString().toStdString();
    client_secret = settings.value("client_secret", QString::fromStdString(client_secret)).toString().toStdString();
    set_market(settings.value("market").toString());

    // Tagging
    QString sep = settings.value("separator", QString::fromStdString(separator)).toString();
    separator = sep.toStdString();
    id3v2_version.set(settings.value("id3v2_version").toString());
    embed_cover = settings.value("embed_cover", embed_cover).toBool();

    // Logging
    log_level.set(settings.value("log_level").toString());
    log_file = settings.value("log_file", QString::fromStdString(log_file)).toString().toStdString();
}

// Accepts an ISO 3166-1 alpha-2 code; anything else leaves the market unchanged
bool Config::set_market(const QString &code)
{
    if (code.size() != 2 || !std::all_of(code.begin(), code.end(), [](QChar c){ return c.isLetter() && c.unicode() < 128; }))
        return false;
    market = code.toUpper().toStdString();
    return true;
}
