#include "jellyfincatalog.hpp"

#include <QDebug>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

namespace utils = baran::utils;

JellyfinCatalog::JellyfinCatalog(const QUrl& baseUrl, const QString& apiKey, std::chrono::milliseconds timeout)
    : m_baseUrl(baseUrl)
    , m_apiKey(apiKey)
    , m_timeout(timeout)
{
}

QVector<CatalogDestination> JellyfinCatalog::destinations(QString* errorMessage)
{
    QString requestError;
    const auto body = request(QByteArrayLiteral("GET"), QStringLiteral("/Library/VirtualFolders"), &requestError);
    if (!body) {
        qWarning() << "Cannot list Jellyfin libraries:" << requestError;
        if (errorMessage) *errorMessage = requestError;
        return {};
    }

    QString parseError;
    const auto parsed = parseVirtualFolders(*body, &parseError);
    if (!parsed) {
        qWarning() << "Unexpected Jellyfin library listing:" << parseError;
        if (errorMessage) *errorMessage = parseError;
        return {};
    }
    if (errorMessage) errorMessage->clear();
    return *parsed;
}

bool JellyfinCatalog::triggerRescan(const CatalogDestination& destination, QString* errorMessage)
{
    QString requestError;
    if (!request(QByteArrayLiteral("POST"), QStringLiteral("/Library/Refresh"), &requestError)) {
        if (errorMessage) *errorMessage = requestError;
        return false;
    }
    qInfo() << "Requested Jellyfin library refresh after import into" << destination.name;
    return true;
}

std::optional<QVector<CatalogDestination>> JellyfinCatalog::parseVirtualFolders(const QByteArray& body, QString* errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        if (errorMessage) {
            *errorMessage = parseError.error != QJsonParseError::NoError
                ? parseError.errorString()
                : QStringLiteral("Expected a JSON array");
        }
        return std::nullopt;
    }

    QVector<CatalogDestination> out;
    const QJsonArray folders = doc.array();
    for (const QJsonValue& value : folders) {
        const QJsonObject folder = value.toObject();
        CatalogDestination d;
        d.id = folder.value(QStringLiteral("ItemId")).toString();
        if (d.id.isEmpty()) continue;
        d.name = folder.value(QStringLiteral("Name")).toString(d.id);
        d.mediaClass = mediaClassFromCollectionType(folder.value(QStringLiteral("CollectionType")).toString());
        const QJsonArray locations = folder.value(QStringLiteral("Locations")).toArray();
        for (const QJsonValue& location : locations) {
            const QString path = location.toString();
            if (!path.isEmpty()) d.paths.append(path);
        }
        out.append(d);
    }
    return out;
}

utils::MediaClass JellyfinCatalog::mediaClassFromCollectionType(const QString& collectionType)
{
    const QString type = collectionType.trimmed().toLower();
    if (type == QStringLiteral("movies") || type == QStringLiteral("tvshows")
        || type == QStringLiteral("musicvideos") || type == QStringLiteral("homevideos")) {
        return utils::MediaClass::Video;
    }
    if (type == QStringLiteral("music")) return utils::MediaClass::Audio;
    return utils::MediaClass::Unknown;
}

std::optional<QByteArray> JellyfinCatalog::request(const QByteArray& verb, const QString& path, QString* errorMessage) const
{
    QUrl url = m_baseUrl;
    QString basePath = url.path();
    while (basePath.endsWith(QLatin1Char('/'))) basePath.chop(1);
    url.setPath(basePath + path);

    QNetworkRequest req(url);
    req.setRawHeader("User-Agent", "baran/1.0");
    req.setRawHeader("X-Emby-Token", m_apiKey.toUtf8());
    req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

    QNetworkAccessManager net;
    QNetworkReply* reply = net.sendCustomRequest(req, verb);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(m_timeout);
    if (!reply->isFinished()) loop.exec();
    timer.stop();

    const QByteArray data = reply->readAll();
    const bool ok = (reply->error() == QNetworkReply::NoError);
    const QString err = reply->errorString();
    delete reply;

    if (timedOut) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 %2 timed out after %3 ms")
                                .arg(QString::fromLatin1(verb), url.toString())
                                .arg(m_timeout.count());
        }
        return std::nullopt;
    }
    if (!ok) {
        if (errorMessage) *errorMessage = QStringLiteral("%1 %2 failed: %3").arg(QString::fromLatin1(verb), url.toString(), err);
        return std::nullopt;
    }
    return data;
}
