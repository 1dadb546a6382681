#include "queuescheduler.hpp"

#include <QDebug>
#include <QDir>

QueueScheduler::QueueScheduler(RecordStore& store, StorageMonitor& storage, TransferEngine& engine,
                               int maxConcurrent, std::chrono::milliseconds passInterval)
    : m_store(store)
    , m_storage(storage)
    , m_engine(engine)
    , m_maxConcurrent(qMax(1, maxConcurrent))
    , m_task(QStringLiteral("queue-scheduler"), passInterval, [this]() { runAdmissionPass(); })
{
}

QueueScheduler::~QueueScheduler()
{
    stop();
}

void QueueScheduler::start()
{
    m_task.start(true);
}

void QueueScheduler::stop()
{
    m_task.stop();
    // Wait for a pass started from another thread.
    QMutexLocker passLocker(&m_passMutex);
}

void QueueScheduler::requestPass()
{
    m_task.triggerNow();
}

void QueueScheduler::setMaxConcurrent(int value)
{
    const int next = qMax(1, value);
    if (m_maxConcurrent.exchange(next) == next) return;
    requestPass();
}

int QueueScheduler::runAdmissionPass()
{
    QMutexLocker passLocker(&m_passMutex);

    int admitted = 0;
    bool changed = false;
    for (;;) {
        if (m_storage.isCritical()) {
            const int waiting = m_store.count(DownloadStatus::Queued);
            if (waiting > 0) qInfo() << "Admission held: storage critical," << waiting << "download(s) waiting";
            break;
        }

        const auto candidate = m_store.nextAdmissible(maxConcurrent());
        if (!candidate) break;
        const QString id = candidate->id;

        QString engineError;
        if (!m_engine.start(*candidate, &engineError)) {
            if (engineError.isEmpty()) engineError = QStringLiteral("Engine failed to start the download");
            qWarning() << "Failed to start download" << id << ":" << engineError;
            DownloadError error;
            if (!m_store.transition(id, DownloadStatus::Queued, DownloadStatus::Failed, engineError, &error)) {
                qWarning() << "Cannot mark download" << id << "failed:" << error.message;
            }
            changed = true;
            continue;
        }

        DownloadError error;
        if (!m_store.transition(id, DownloadStatus::Queued, DownloadStatus::Active, std::nullopt, &error)) {
            qWarning() << "Download" << id << "changed during admission (" << error.message << "), stopping its session";
            QString stopError;
            if (!m_engine.stop(id, false, &stopError)) {
                qWarning() << "Failed to stop session" << id << ":" << stopError;
            }
            continue;
        }
        qInfo() << "Started download" << id << candidate->displayName;
        ++admitted;
        changed = true;
    }

    if (changed) m_store.persist();
    return admitted;
}

bool QueueScheduler::pause(const QString& id, DownloadError* error)
{
    QMutexLocker passLocker(&m_passMutex);

    const auto record = m_store.get(id, error);
    if (!record) return false;
    if (record->status == DownloadStatus::Paused) return true;
    if (record->status != DownloadStatus::Active) {
        return setDownloadError(error, DownloadError::Kind::Conflict,
                                QStringLiteral("Cannot pause a download that is %1").arg(statusToString(record->status)));
    }

    QString engineError;
    if (!m_engine.pause(id, &engineError)) {
        return setDownloadError(error, DownloadError::Kind::Engine, engineError);
    }
    if (!m_store.transition(id, DownloadStatus::Active, DownloadStatus::Paused, std::nullopt, error)) return false;

    qInfo() << "Paused download" << id;
    m_store.persist();
    passLocker.unlock();
    requestPass();
    return true;
}

bool QueueScheduler::resume(const QString& id, DownloadError* error)
{
    QMutexLocker passLocker(&m_passMutex);

    const auto record = m_store.get(id, error);
    if (!record) return false;
    if (record->status == DownloadStatus::Active) return true;
    if (record->status != DownloadStatus::Paused) {
        return setDownloadError(error, DownloadError::Kind::Conflict,
                                QStringLiteral("Cannot resume a download that is %1").arg(statusToString(record->status)));
    }
    if (m_store.count(DownloadStatus::Active) >= maxConcurrent()) {
        return setDownloadError(error, DownloadError::Kind::Conflict,
                                QStringLiteral("Concurrency limit of %1 reached").arg(maxConcurrent()));
    }

    QString engineError;
    const bool hasSession = m_engine.progress(id).has_value();
    const bool ok = hasSession ? m_engine.resume(id, &engineError) : m_engine.start(*record, &engineError);
    if (!ok) {
        return setDownloadError(error, DownloadError::Kind::Engine, engineError);
    }
    if (!m_store.transition(id, DownloadStatus::Paused, DownloadStatus::Active, std::nullopt, error)) return false;

    qInfo() << "Resumed download" << id;
    m_store.persist();
    return true;
}

bool QueueScheduler::cancel(const QString& id, bool deleteFiles, DownloadError* error)
{
    QMutexLocker passLocker(&m_passMutex);

    bool importing = false;
    const auto record = m_store.take(id, [&importing](const DownloadRecord& r) {
        importing = (r.status == DownloadStatus::Importing);
        return !importing;
    });
    if (!record) {
        if (importing) {
            return setDownloadError(error, DownloadError::Kind::Conflict,
                                    QStringLiteral("Download %1 is being imported").arg(id));
        }
        return setDownloadError(error, DownloadError::Kind::NotFound, QStringLiteral("Download %1 not found").arg(id));
    }

    if (record->status == DownloadStatus::Active || record->status == DownloadStatus::Paused) {
        QString engineError;
        if (!m_engine.stop(id, deleteFiles, &engineError)) {
            qWarning() << "Failed to stop session" << id << "while cancelling:" << engineError;
        }
    }

    if (deleteFiles && !record->stagingPath.isEmpty() && QDir(record->stagingPath).exists()) {
        if (!QDir(record->stagingPath).removeRecursively()) {
            qWarning() << "Failed to remove staging directory" << record->stagingPath;
        }
    }

    qInfo() << "Cancelled download" << id << (deleteFiles ? "and removed its files" : "");
    m_store.persist();
    passLocker.unlock();
    if (record->status == DownloadStatus::Active) requestPass();
    return true;
}
