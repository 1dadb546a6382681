#include "staticcatalog.hpp"

#include <QDebug>
#include <QMutexLocker>

StaticCatalog::StaticCatalog(const QVector<CatalogDestination>& destinations)
    : m_destinations(destinations)
{
}

void StaticCatalog::setDestinations(const QVector<CatalogDestination>& destinations)
{
    QMutexLocker lock(&m_mutex);
    m_destinations = destinations;
}

QVector<CatalogDestination> StaticCatalog::destinations(QString* errorMessage)
{
    if (errorMessage) errorMessage->clear();
    QMutexLocker lock(&m_mutex);
    return m_destinations;
}

bool StaticCatalog::triggerRescan(const CatalogDestination& destination, QString* errorMessage)
{
    if (errorMessage) errorMessage->clear();
    QMutexLocker lock(&m_mutex);
    ++m_rescans;
    qInfo() << "Content placed in" << destination.name << destination.paths.value(0)
            << "- no media server configured, rescan skipped";
    return true;
}

int StaticCatalog::rescanCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_rescans;
}
