/*!
 * @file        jellyfincatalog.hpp
 * @brief       Catalog backed by a Jellyfin media server.
 * @details     Destinations are the server's virtual folders (libraries),
 *              fetched from /Library/VirtualFolders. Rescans are requested with
 *              POST /Library/Refresh. Requests carry the API key in the
 *              X-Emby-Token header and are bounded by a timeout.
 *
 *              Every request runs a private QNetworkAccessManager inside a
 *              local event loop, so the catalog can be called from any thread,
 *              including import workers.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_SERVICES_JELLYFINCATALOG_HPP
#define BARAN_SERVICES_JELLYFINCATALOG_HPP

#include "core/catalog.hpp"

#include <QByteArray>
#include <QUrl>

#include <chrono>
#include <optional>

class JellyfinCatalog : public CatalogService {
public:
    /**
     * @brief Creates a client for a server.
     * @param baseUrl Server root, e.g. http://localhost:8096.
     * @param apiKey API key created in the server dashboard.
     * @param timeout Bound on a single request.
     */
    JellyfinCatalog(const QUrl& baseUrl, const QString& apiKey,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(15000));

    QVector<CatalogDestination> destinations(QString* errorMessage = nullptr) override;
    bool triggerRescan(const CatalogDestination& destination, QString* errorMessage) override;

    /**
     * @brief Parses a /Library/VirtualFolders response body.
     * @param body JSON array of virtual folders.
     * @param errorMessage Set when the body is not a JSON array.
     * @return Folders that have an ItemId, in server order.
     */
    static std::optional<QVector<CatalogDestination>> parseVirtualFolders(const QByteArray& body,
                                                                          QString* errorMessage = nullptr);

    /**
     * @brief Maps a Jellyfin CollectionType to a content class.
     */
    static baran::utils::MediaClass mediaClassFromCollectionType(const QString& collectionType);

private:
    std::optional<QByteArray> request(const QByteArray& verb, const QString& path, QString* errorMessage) const;

    QUrl m_baseUrl;                         //!< @brief Server root.
    QString m_apiKey;                       //!< @brief X-Emby-Token value.
    std::chrono::milliseconds m_timeout;    //!< @brief Request bound.
};

#endif // BARAN_SERVICES_JELLYFINCATALOG_HPP
