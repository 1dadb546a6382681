#include "importcoordinator.hpp"

#include "utils/category_utils.hpp"
#include "utils/download_utils.hpp"

#include <QDateTime>
#include <QDeadlineTimer>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QtConcurrent>

#include <algorithm>

namespace utils = baran::utils;

ImportCoordinator::ImportCoordinator(RecordStore& store, StorageMonitor& storage, CatalogService& catalog,
                                     const ImportSettings& settings)
    : m_store(store)
    , m_storage(storage)
    , m_catalog(catalog)
    , m_settings(settings)
{
    m_settings.maxAttempts = qMax(1, m_settings.maxAttempts);
    m_pool.setMaxThreadCount(2);
    m_pool.setObjectName(QStringLiteral("imports"));
}

ImportCoordinator::~ImportCoordinator()
{
    shutdown();
}

void ImportCoordinator::setSleeper(Sleeper sleeper)
{
    QMutexLocker locker(&m_mutex);
    m_sleeper = std::move(sleeper);
}

std::chrono::milliseconds ImportCoordinator::backoffDelay(std::chrono::milliseconds base, int retry)
{
    const int exponent = qBound(0, retry - 1, 20);
    return base * (qint64(1) << exponent);
}

bool ImportCoordinator::enqueue(const QString& id, bool manual)
{
    QMutexLocker locker(&m_mutex);
    if (m_stopping) {
        qWarning() << "Import of" << id << "rejected: shutting down";
        return false;
    }

    m_pending.erase(std::remove_if(m_pending.begin(), m_pending.end(),
                                   [](const QFuture<void>& f) { return f.isFinished(); }),
                    m_pending.end());

    QFuture<void> future = QtConcurrent::run(&m_pool, [this, id, manual]() {
        importNow(id, manual);
    });
    m_pending.append(future);
    return true;
}

void ImportCoordinator::waitForIdle()
{
    QList<QFuture<void>> pending;
    {
        QMutexLocker locker(&m_mutex);
        pending = m_pending;
    }
    for (QFuture<void>& f : pending) f.waitForFinished();
}

void ImportCoordinator::shutdown()
{
    {
        QMutexLocker locker(&m_mutex);
        m_stopping = true;
        m_wake.wakeAll();
    }
    waitForIdle();
    m_pool.waitForDone();
}

void ImportCoordinator::runExclusive(const std::function<void()>& fn)
{
    QWriteLocker locker(&m_stagingLock);
    fn();
}

bool ImportCoordinator::sleep(std::chrono::milliseconds delay)
{
    QMutexLocker locker(&m_mutex);
    if (m_sleeper) {
        const Sleeper sleeper = m_sleeper;
        locker.unlock();
        return sleeper(delay);
    }

    QDeadlineTimer deadline(delay);
    while (!m_stopping) {
        if (!m_wake.wait(&m_mutex, deadline)) break;
    }
    return !m_stopping;
}

std::optional<CatalogDestination> ImportCoordinator::selectDestination(const DownloadRecord& record,
                                                                       utils::MediaClass mediaClass,
                                                                       QString* errorMessage,
                                                                       bool* retryable)
{
    if (retryable) *retryable = false;

    if (record.destinationId && !record.destinationId->isEmpty()) {
        const auto explicitDestination = m_catalog.resolveDestination(*record.destinationId);
        if (explicitDestination && !explicitDestination->paths.isEmpty()) return explicitDestination;
        qWarning() << "Destination" << *record.destinationId << "of download" << record.id
                   << "is not available, selecting another one";
    }

    QString catalogError;
    const QVector<CatalogDestination> all = m_catalog.destinations(&catalogError);

    if (mediaClass != utils::MediaClass::Unknown) {
        for (const CatalogDestination& d : all) {
            if (d.mediaClass == mediaClass && !d.paths.isEmpty()) return d;
        }
    }
    if (!m_settings.defaultDestinationId.isEmpty()) {
        for (const CatalogDestination& d : all) {
            if (d.id == m_settings.defaultDestinationId && !d.paths.isEmpty()) return d;
        }
    }
    for (const CatalogDestination& d : all) {
        if (!d.paths.isEmpty()) return d;
    }

    if (!catalogError.isEmpty()) {
        if (retryable) *retryable = true;
        if (errorMessage) *errorMessage = QStringLiteral("Catalog unavailable: %1").arg(catalogError);
    } else if (errorMessage) {
        *errorMessage = QStringLiteral("No catalog destination available");
    }
    return std::nullopt;
}

ImportCoordinator::AttemptResult ImportCoordinator::runAttempt(const DownloadRecord& record, QString* errorMessage)
{
    const QString staging = record.stagingPath;
    const utils::MediaClass mediaClass = utils::classifyDirectory(staging);

    bool retryable = false;
    const auto destination = selectDestination(record, mediaClass, errorMessage, &retryable);
    if (!destination) return retryable ? AttemptResult::Retry : AttemptResult::NoDestination;

    if (m_storage.isCritical()) {
        if (errorMessage) *errorMessage = QStringLiteral("Storage is critical");
        return AttemptResult::Retry;
    }

    const QString root = destination->paths.first();
    const qint64 size = utils::directorySize(staging);
    if (!m_storage.hasSufficientSpace(root, size, errorMessage)) return AttemptResult::Retry;

    const QString folder = record.displayName.isEmpty() ? QFileInfo(staging).fileName() : record.displayName;
    const QString target = utils::timestampedUniquePath(QDir(root).filePath(folder), QDateTime::currentDateTimeUtc());
    bool renamed = false;
    if (!utils::moveDirectory(staging, target, &renamed, errorMessage)) return AttemptResult::Retry;

    qInfo() << "Imported download" << record.id << "as" << utils::mediaClassName(mediaClass)
            << "into" << destination->name << "at" << target << (renamed ? "" : "(copied across volumes)");

    QString rescanError;
    if (!m_catalog.triggerRescan(*destination, &rescanError)) {
        qWarning() << "Catalog rescan of" << destination->name << "failed:" << rescanError;
    }

    if (m_settings.removeAfterImport && QDir(staging).exists()) {
        if (!QDir(staging).removeRecursively()) {
            qWarning() << "Failed to remove staging directory" << staging;
        }
    }
    return AttemptResult::Success;
}

void ImportCoordinator::finish(const QString& id, DownloadStatus status, const std::optional<QString>& message)
{
    DownloadError error;
    if (!m_store.transition(id, DownloadStatus::Importing, status, message, &error)) {
        qWarning() << "Cannot finish import of" << id << ":" << error.message;
        return;
    }
    m_store.persist();
}

ImportOutcome ImportCoordinator::importNow(const QString& id, bool manual)
{
    QReadLocker claimLocker(&m_stagingLock);
    const auto record = m_store.get(id);
    if (!record) {
        qDebug() << "Import skipped: download" << id << "no longer exists";
        return ImportOutcome::Skipped;
    }
    if (record->status != DownloadStatus::Completed) {
        qDebug() << "Import skipped: download" << id << "is" << statusToString(record->status);
        return ImportOutcome::Skipped;
    }
    if (!manual && !m_settings.autoImport) {
        qInfo() << "Automatic import disabled, download" << id << "left in staging";
        return ImportOutcome::Skipped;
    }
    if (record->stagingPath.isEmpty() || !QDir(record->stagingPath).exists()) {
        qInfo() << "Import skipped: staging directory of" << id << "is gone";
        return ImportOutcome::Skipped;
    }

    DownloadError error;
    if (!m_store.transition(id, DownloadStatus::Completed, DownloadStatus::Importing, std::nullopt, &error)) {
        qWarning() << "Import skipped:" << error.message;
        return ImportOutcome::Skipped;
    }
    claimLocker.unlock();

    const int attempts = m_settings.maxAttempts;
    QString lastError;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            const auto delay = backoffDelay(m_settings.baseDelay, attempt - 1);
            qInfo() << "Retrying import of" << id << "in" << delay.count() << "ms"
                    << "(attempt" << attempt << "of" << attempts << ")";
            if (!sleep(delay)) {
                finish(id, DownloadStatus::Completed,
                       QStringLiteral("Import interrupted by shutdown; manual import required"));
                return ImportOutcome::Interrupted;
            }
        }

        lastError.clear();
        AttemptResult result;
        {
            QReadLocker attemptLocker(&m_stagingLock);
            result = runAttempt(*record, &lastError);
        }
        switch (result) {
        case AttemptResult::Success:
            finish(id, DownloadStatus::Imported, std::nullopt);
            return ImportOutcome::Imported;
        case AttemptResult::NoDestination:
            qWarning() << "Import of" << id << "aborted:" << lastError;
            finish(id, DownloadStatus::Completed, QStringLiteral("%1; manual import required").arg(lastError));
            return ImportOutcome::NoDestination;
        case AttemptResult::Retry:
            qWarning() << "Import attempt" << attempt << "of" << attempts << "for" << id << "failed:" << lastError;
            break;
        }
    }

    qCritical() << "Import of" << id << "failed after" << attempts << "attempt(s)";
    finish(id, DownloadStatus::Completed,
           QStringLiteral("Import failed after %1 attempt(s): %2; manual import required").arg(attempts).arg(lastError));
    return ImportOutcome::Failed;
}
