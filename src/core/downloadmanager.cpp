#include "downloadmanager.hpp"

#include "utils/download_utils.hpp"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QSet>
#include <QUuid>

namespace utils = baran::utils;

DownloadManager::DownloadManager(const DownloaderSettings& settings, TransferEngine& engine, CatalogService& catalog,
                                 VolumeProbe probe, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_engine(engine, settings.engineCallTimeout)
    , m_catalog(catalog)
    , m_store(settings.stateFile)
    , m_storage(settings.stagingDirectory, settings.storage, &catalog, std::move(probe))
    , m_scheduler(m_store, m_storage, m_engine, settings.maxConcurrentDownloads, settings.passInterval)
    , m_poller(m_store, m_engine, settings.pollInterval)
    , m_importer(m_store, m_storage, catalog, settings.importing)
    , m_cleanupTask(QStringLiteral("staging-cleanup"), settings.cleanupInterval, [this]() { runRetentionCleanup(); })
{
    m_store.setStatusObserver([this](const DownloadRecord& record) {
        emit downloadStatusChanged(record.id, statusToString(record.status));
        emit countsChanged();
    });
    m_storage.setActivityProbe([this]() {
        return m_store.count(DownloadStatus::Active) > 0;
    });
    m_storage.setGateObserver([this](bool critical) {
        emit storageCriticalChanged(critical);
        if (!critical) m_scheduler.requestPass();
    });
    m_poller.setCompletionHandler([this](const DownloadRecord& record) {
        onCompleted(record);
    });
}

DownloadManager::~DownloadManager()
{
    shutdown();
}

bool DownloadManager::startup(DownloadError* error)
{
    if (m_running.load()) return true;

    QString engineError;
    if (!m_engine.initialize(m_settings.engine, &engineError)) {
        qCritical() << "Transfer engine failed to initialize:" << engineError;
        return setDownloadError(error, DownloadError::Kind::Engine, engineError);
    }
    m_engineReady = true;

    if (!QDir().mkpath(m_settings.stagingDirectory)) {
        qCritical() << "Cannot create staging directory" << m_settings.stagingDirectory;
        m_engine.shutdown();
        m_engineReady = false;
        return setDownloadError(error, DownloadError::Kind::Persistence,
                                QStringLiteral("Cannot create staging directory %1").arg(m_settings.stagingDirectory));
    }

    RecordStore::LoadResult loaded;
    DownloadError loadError;
    if (!m_store.load(&loaded, &loadError)) {
        qCritical() << loadError.kindName() << loadError.message << "- starting with an empty download list";
    }
    if (loaded.demotedActive > 0 || loaded.demotedImporting > 0) m_store.persist();

    m_storage.checkNow();
    m_storage.start();
    m_scheduler.start();
    m_poller.start();
    if (m_settings.enableAutomaticCleanup) m_cleanupTask.start(true);

    m_running = true;
    qInfo() << "Download manager started:" << m_store.size() << "download(s), limit"
            << m_scheduler.maxConcurrent() << "concurrent, staging" << m_settings.stagingDirectory;
    emit countsChanged();
    return true;
}

void DownloadManager::shutdown()
{
    const bool wasRunning = m_running.exchange(false);
    if (!wasRunning && !m_engineReady.load()) return;

    qInfo() << "Download manager shutting down";
    m_poller.stop();
    m_storage.stop();
    m_cleanupTask.stop();
    m_scheduler.stop();
    m_importer.shutdown();

    QStringList sessions = m_store.ids(DownloadStatus::Active);
    sessions.append(m_store.ids(DownloadStatus::Paused));
    for (const QString& id : std::as_const(sessions)) {
        QString engineError;
        if (!m_engine.stop(id, false, &engineError)) {
            qWarning() << "Failed to stop session" << id << "during shutdown:" << engineError;
        }
    }
    m_engine.shutdown();
    m_engineReady = false;

    m_store.persist();
    qInfo() << "Download manager stopped";
}

std::optional<DownloadRecord> DownloadManager::createDownload(const QString& source, const QString& owner,
                                                              const QString& destinationId, DownloadError* error)
{
    if (!m_running.load()) {
        setDownloadError(error, DownloadError::Kind::Conflict, QStringLiteral("Download manager is not running"));
        return std::nullopt;
    }

    const QString trimmed = source.trimmed();
    if (trimmed.isEmpty()) {
        setDownloadError(error, DownloadError::Kind::Validation, QStringLiteral("Source is required"));
        return std::nullopt;
    }
    if (owner.trimmed().isEmpty()) {
        setDownloadError(error, DownloadError::Kind::Validation, QStringLiteral("Owner is required"));
        return std::nullopt;
    }
    if (!m_engine.validate(trimmed)) {
        qWarning() << "Rejected invalid source" << trimmed;
        setDownloadError(error, DownloadError::Kind::Validation,
                         QStringLiteral("Invalid source: expected a magnet URI or a .torrent file"));
        return std::nullopt;
    }
    if (!destinationId.isEmpty() && !m_catalog.resolveDestination(destinationId)) {
        setDownloadError(error, DownloadError::Kind::Validation,
                         QStringLiteral("Unknown destination %1").arg(destinationId));
        return std::nullopt;
    }
    if (m_storage.isCritical()) {
        qWarning() << "Rejected new download: storage critical";
        setDownloadError(error, DownloadError::Kind::Conflict,
                         QStringLiteral("Storage space critically low; new downloads are not accepted"));
        return std::nullopt;
    }

    DownloadRecord record;
    record.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    record.source = trimmed;
    record.owner = owner.trimmed();
    record.displayName = utils::displayNameFromSource(trimmed);
    record.status = DownloadStatus::Queued;
    record.stagingPath = QDir(m_settings.stagingDirectory).filePath(record.id);
    if (!destinationId.isEmpty()) record.destinationId = destinationId;
    record.createdAt = QDateTime::currentDateTimeUtc();

    if (!QDir().mkpath(record.stagingPath)) {
        setDownloadError(error, DownloadError::Kind::Conflict,
                         QStringLiteral("Cannot create staging directory %1").arg(record.stagingPath));
        return std::nullopt;
    }
    if (!m_store.insert(record, error)) return std::nullopt;
    m_store.persist();

    qInfo() << "Queued download" << record.id << record.displayName << "for" << record.owner;
    emit downloadCreated(record.id);
    emit countsChanged();
    m_scheduler.requestPass();
    return record;
}

std::optional<DownloadRecord> DownloadManager::getDownload(const QString& id, DownloadError* error) const
{
    return m_store.get(id, error);
}

QVector<DownloadRecord> DownloadManager::listDownloads(std::optional<DownloadStatus> filter) const
{
    return m_store.list(filter);
}

bool DownloadManager::pauseDownload(const QString& id, DownloadError* error)
{
    return m_scheduler.pause(id, error);
}

bool DownloadManager::resumeDownload(const QString& id, DownloadError* error)
{
    return m_scheduler.resume(id, error);
}

bool DownloadManager::cancelDownload(const QString& id, bool deleteFiles, DownloadError* error)
{
    if (!m_scheduler.cancel(id, deleteFiles, error)) return false;
    emit downloadRemoved(id);
    emit countsChanged();
    return true;
}

bool DownloadManager::importDownload(const QString& id, DownloadError* error)
{
    const auto record = m_store.get(id, error);
    if (!record) return false;
    if (record->status != DownloadStatus::Completed) {
        return setDownloadError(error, DownloadError::Kind::Conflict,
                                QStringLiteral("Only completed downloads can be imported, %1 is %2")
                                    .arg(id, statusToString(record->status)));
    }
    if (!QDir(record->stagingPath).exists()) {
        return setDownloadError(error, DownloadError::Kind::Conflict,
                                QStringLiteral("Staging directory %1 no longer exists").arg(record->stagingPath));
    }
    if (!m_importer.enqueue(id, true)) {
        return setDownloadError(error, DownloadError::Kind::Conflict, QStringLiteral("Download manager is shutting down"));
    }
    return true;
}

QVector<VolumeStatus> DownloadManager::volumesStatus() const
{
    return m_storage.volumes();
}

CleanupResult DownloadManager::triggerCleanup()
{
    const QStringList ids = m_store.ids();
    const QSet<QString> validIds(ids.cbegin(), ids.cend());
    CleanupResult result = m_storage.cleanupOrphaned(validIds);
    if (m_settings.enableAutomaticCleanup) result += runRetentionCleanup();
    return result;
}

CleanupResult DownloadManager::runRetentionCleanup()
{
    CleanupResult result;
    m_importer.runExclusive([this, &result]() {
        QSet<QString> protectedIds;
        const QVector<DownloadRecord> records = m_store.list();
        for (const DownloadRecord& record : records) {
            switch (record.status) {
            case DownloadStatus::Queued:
            case DownloadStatus::Active:
            case DownloadStatus::Paused:
            case DownloadStatus::Importing:
                protectedIds.insert(record.id);
                break;
            case DownloadStatus::Completed:
            case DownloadStatus::Failed:
            case DownloadStatus::Imported:
                break;
            }
        }
        const QDateTime cutoff = QDateTime::currentDateTimeUtc().addDays(-m_settings.cleanupRetentionDays);
        result = m_storage.cleanupOlderThan(cutoff, protectedIds);
    });
    return result;
}

int DownloadManager::activeCount() const
{
    return m_store.count(DownloadStatus::Active);
}

int DownloadManager::queuedCount() const
{
    return m_store.count(DownloadStatus::Queued);
}

bool DownloadManager::storageCritical() const
{
    return m_storage.isCritical();
}

void DownloadManager::onCompleted(const DownloadRecord& record)
{
    QString engineError;
    if (!m_engine.stop(record.id, false, &engineError)) {
        qWarning() << "Failed to release session of completed download" << record.id << ":" << engineError;
    }
    m_scheduler.requestPass();

    if (!m_settings.importing.autoImport) {
        qInfo() << "Download" << record.id << "completed; automatic import disabled";
        return;
    }
    if (!m_importer.enqueue(record.id)) {
        qWarning() << "Download" << record.id << "completed during shutdown; import left for later";
    }
}
