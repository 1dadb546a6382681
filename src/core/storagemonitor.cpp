#include "storagemonitor.hpp"

#include "utils/download_utils.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStorageInfo>

namespace utils = baran::utils;

QString storageHealthName(StorageHealth health)
{
    switch (health) {
    case StorageHealth::Normal: return QStringLiteral("Normal");
    case StorageHealth::Warning: return QStringLiteral("Warning");
    case StorageHealth::Critical: return QStringLiteral("Critical");
    }
    return QString();
}

StorageMonitor::StorageMonitor(const QString& stagingDirectory, const StorageSettings& settings,
                               CatalogService* catalog, VolumeProbe probe)
    : m_stagingDirectory(stagingDirectory)
    , m_settings(settings)
    , m_catalog(catalog)
    , m_probe(probe ? std::move(probe) : VolumeProbe(&StorageMonitor::systemProbe))
    , m_task(QStringLiteral("storage-monitor"), settings.idleInterval, [this]() { checkNow(); })
{
}

StorageMonitor::~StorageMonitor()
{
    stop();
}

void StorageMonitor::setActivityProbe(std::function<bool()> isActive)
{
    QMutexLocker locker(&m_mutex);
    m_activityProbe = std::move(isActive);
}

void StorageMonitor::setGateObserver(std::function<void(bool critical)> observer)
{
    QMutexLocker locker(&m_mutex);
    m_gateObserver = std::move(observer);
}

void StorageMonitor::start()
{
    m_task.start(false);
}

void StorageMonitor::stop()
{
    m_task.stop();
}

std::optional<VolumeSample> StorageMonitor::systemProbe(const QString& path)
{
    QString existing = QFileInfo(path).absoluteFilePath();
    while (!existing.isEmpty() && !QFileInfo::exists(existing)) {
        const QString parent = QFileInfo(existing).absolutePath();
        if (parent == existing) break;
        existing = parent;
    }

    QStorageInfo storage(existing);
    if (!storage.isValid() || !storage.isReady()) return std::nullopt;

    VolumeSample sample;
    sample.rootPath = storage.rootPath();
    sample.availableBytes = storage.bytesAvailable();
    sample.totalBytes = storage.bytesTotal();
    return sample;
}

void StorageMonitor::checkNow()
{
    QMutexLocker checkLocker(&m_checkMutex);

    QStringList paths { m_stagingDirectory };
    if (m_catalog) {
        QString catalogError;
        const QVector<CatalogDestination> destinations = m_catalog->destinations(&catalogError);
        if (!catalogError.isEmpty()) {
            qWarning() << "Storage check: cannot enumerate catalog destinations:" << catalogError;
        }
        for (const CatalogDestination& d : destinations) paths.append(d.paths);
    }

    QVector<VolumeStatus> next;
    QSet<QString> seen;
    for (int i = 0; i < paths.size(); ++i) {
        const auto sample = m_probe(paths.at(i));
        if (!sample) {
            qWarning() << "Storage check: cannot sample volume for" << paths.at(i);
            continue;
        }
        if (seen.contains(sample->rootPath)) continue;
        seen.insert(sample->rootPath);

        VolumeStatus status;
        status.path = sample->rootPath;
        status.availableBytes = sample->availableBytes;
        status.totalBytes = sample->totalBytes;
        status.isStagingVolume = (i == 0);
        next.append(status);
    }

    bool gateChanged = false;
    bool critical = false;
    std::function<void(bool)> observer;
    std::function<bool()> activityProbe;
    {
        QMutexLocker locker(&m_mutex);
        QSet<QString> latched;
        for (VolumeStatus& v : next) {
            bool isLatched = m_latched.contains(v.path);
            if (v.availableBytes < m_settings.criticalThresholdBytes) {
                if (!isLatched) {
                    qWarning() << "Volume" << v.path << "is critical:" << v.availableBytes << "bytes available";
                }
                isLatched = true;
            } else if (isLatched && v.availableBytes > m_settings.recoveryThresholdBytes) {
                qInfo() << "Volume" << v.path << "recovered:" << v.availableBytes << "bytes available";
                isLatched = false;
            }

            if (isLatched) {
                latched.insert(v.path);
                v.health = StorageHealth::Critical;
            } else if (v.availableBytes < m_settings.warningThresholdBytes) {
                v.health = StorageHealth::Warning;
            } else {
                v.health = StorageHealth::Normal;
            }
        }

        // A latched root missing from this sample stays latched until it is seen above recovery.
        for (const QString& root : std::as_const(m_latched)) {
            if (seen.contains(root)) continue;
            qWarning() << "Volume" << root << "was not sampled, keeping it critical";
            latched.insert(root);
        }

        m_latched = latched;
        m_volumes = next;
        critical = !m_latched.isEmpty();
        gateChanged = (critical != m_critical);
        m_critical = critical;
        observer = m_gateObserver;
        activityProbe = m_activityProbe;
    }

    if (gateChanged) {
        if (critical) {
            qWarning() << "Storage critical: admissions and imports are blocked";
        } else {
            qInfo() << "Storage recovered: admissions and imports resume";
        }
        if (observer) observer(critical);
    }

    if (activityProbe) {
        m_task.setInterval(activityProbe() ? m_settings.activeInterval : m_settings.idleInterval);
    }
}

bool StorageMonitor::isCritical() const
{
    QMutexLocker locker(&m_mutex);
    return m_critical;
}

QVector<VolumeStatus> StorageMonitor::volumes() const
{
    QMutexLocker locker(&m_mutex);
    return m_volumes;
}

bool StorageMonitor::hasSufficientSpace(const QString& path, qint64 requiredBytes, QString* errorMessage) const
{
    const auto sample = m_probe(path);
    if (!sample) {
        if (errorMessage) *errorMessage = QStringLiteral("Cannot determine free space for %1").arg(path);
        return false;
    }
    if (sample->availableBytes < requiredBytes) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Insufficient space on %1: %2 bytes required, %3 available")
                                .arg(sample->rootPath).arg(requiredBytes).arg(sample->availableBytes);
        }
        return false;
    }
    return true;
}

template <typename Predicate>
CleanupResult StorageMonitor::removeStagingDirectories(const char* reason, Predicate shouldRemove)
{
    QMutexLocker checkLocker(&m_checkMutex);
    CleanupResult result;

    QDir staging(m_stagingDirectory);
    if (!staging.exists()) return result;

    const QFileInfoList entries = staging.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden);
    for (const QFileInfo& entry : entries) {
        if (!shouldRemove(entry)) continue;

        const qint64 size = utils::directorySize(entry.absoluteFilePath());
        if (!QDir(entry.absoluteFilePath()).removeRecursively()) {
            qWarning() << "Cleanup: failed to remove" << entry.absoluteFilePath();
            continue;
        }
        qDebug() << "Cleanup: removed" << reason << "directory" << entry.fileName() << size << "bytes";
        ++result.removed;
        result.bytesFreed += size;
    }

    if (result.removed > 0) {
        qInfo() << "Cleanup removed" << result.removed << reason << "director(ies), freed" << result.bytesFreed << "bytes";
    }
    return result;
}

CleanupResult StorageMonitor::cleanupOrphaned(const QSet<QString>& validIds)
{
    return removeStagingDirectories("orphaned", [&validIds](const QFileInfo& entry) {
        return !validIds.contains(entry.fileName());
    });
}

CleanupResult StorageMonitor::cleanupOlderThan(const QDateTime& cutoff, const QSet<QString>& protectedIds)
{
    const QDateTime cutoffUtc = cutoff.toUTC();
    return removeStagingDirectories("expired", [&cutoffUtc, &protectedIds](const QFileInfo& entry) {
        if (protectedIds.contains(entry.fileName())) return false;
        return entry.lastModified().toUTC() < cutoffUtc;
    });
}
