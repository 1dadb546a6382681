/*!
 * @file        staticcatalog.hpp
 * @brief       Catalog backed by configured destinations.
 * @details     Serves the destinations listed in the configuration file. No
 *              media server is contacted, so rescans are only logged.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_SERVICES_STATICCATALOG_HPP
#define BARAN_SERVICES_STATICCATALOG_HPP

#include "core/catalog.hpp"

#include <QMutex>
#include <QVector>

class StaticCatalog : public CatalogService {
public:
    explicit StaticCatalog(const QVector<CatalogDestination>& destinations = {});

    /**
     * @brief Replaces the destination list.
     */
    void setDestinations(const QVector<CatalogDestination>& destinations);

    QVector<CatalogDestination> destinations(QString* errorMessage = nullptr) override;
    bool triggerRescan(const CatalogDestination& destination, QString* errorMessage) override;

    /**
     * @brief Number of rescans requested so far.
     */
    int rescanCount() const;

private:
    mutable QMutex m_mutex;
    QVector<CatalogDestination> m_destinations;
    int m_rescans = 0;
};

#endif // BARAN_SERVICES_STATICCATALOG_HPP
