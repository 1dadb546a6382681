/*!
 * @file        catalog.hpp
 * @brief       Contract of the content catalog (media library).
 * @details     Completed downloads are relocated into a catalog destination.
 *              The core only needs to enumerate destinations, resolve one by
 *              id and ask the catalog to rescan after new content arrived.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_CATALOG_HPP
#define BARAN_CORE_CATALOG_HPP

#include "utils/category_utils.hpp"

#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

/**
 * @brief One catalog (library) entry that can receive content.
 */
struct CatalogDestination {
    QString id;                                                     //!< @brief Catalog specific id.
    QString name;                                                   //!< @brief Display name.
    baran::utils::MediaClass mediaClass = baran::utils::MediaClass::Unknown; //!< @brief Content class served.
    QStringList paths;                                              //!< @brief Folder locations, first one receives imports.

    bool operator==(const CatalogDestination& other) const = default;
};

/**
 * @brief Abstract content catalog.
 */
class CatalogService {
public:
    virtual ~CatalogService() = default;

    /**
     * @brief Lists all destinations.
     * @param errorMessage Optional failure description.
     * @return Destinations in catalog order, empty on failure.
     */
    virtual QVector<CatalogDestination> destinations(QString* errorMessage = nullptr) = 0;

    /**
     * @brief Looks up a destination by id.
     * @return The destination, or std::nullopt if unknown.
     */
    virtual std::optional<CatalogDestination> resolveDestination(const QString& id)
    {
        const QVector<CatalogDestination> all = destinations();
        for (const CatalogDestination& d : all) {
            if (d.id == id) return d;
        }
        return std::nullopt;
    }

    /**
     * @brief Asks the catalog to pick up new content in a destination.
     * @param destination Destination that received content.
     * @param errorMessage Optional failure description.
     * @return true when the rescan request was accepted.
     */
    virtual bool triggerRescan(const CatalogDestination& destination, QString* errorMessage) = 0;
};

#endif // BARAN_CORE_CATALOG_HPP
