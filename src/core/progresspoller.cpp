#include "progresspoller.hpp"

#include <QDebug>

#include <utility>

ProgressPoller::ProgressPoller(RecordStore& store, TransferEngine& engine, std::chrono::milliseconds interval)
    : m_store(store)
    , m_engine(engine)
    , m_task(QStringLiteral("progress-poller"), interval, [this]() { pollOnce(); })
{
}

ProgressPoller::~ProgressPoller()
{
    stop();
}

void ProgressPoller::setCompletionHandler(CompletionHandler handler)
{
    QMutexLocker locker(&m_handlerMutex);
    m_completionHandler = std::move(handler);
}

void ProgressPoller::start()
{
    m_task.start(false);
}

void ProgressPoller::stop()
{
    m_task.stop();
}

std::optional<qint64> ProgressPoller::estimateSeconds(qint64 totalSize, qint64 transferredSize, qint64 downloadRate)
{
    if (downloadRate <= 0) return std::nullopt;
    const qint64 remaining = qMax<qint64>(0, totalSize - transferredSize);
    return remaining / downloadRate;
}

int ProgressPoller::pollOnce()
{
    const QStringList activeIds = m_store.ids(DownloadStatus::Active);
    if (activeIds.isEmpty()) return 0;

    int updated = 0;
    QVector<DownloadRecord> completed;
    for (const QString& id : activeIds) {
        const auto metrics = m_engine.progress(id);
        if (!metrics) continue;

        const double percent = qBound(0.0, metrics->percent, 100.0);
        const bool applied = m_store.update(id, [&metrics, percent](DownloadRecord& record) {
            if (record.status != DownloadStatus::Active) return false;
            record.totalSize = metrics->totalSize;
            record.transferredSize = metrics->transferredSize;
            record.percent = percent;
            record.downloadRate = metrics->downloadRate;
            record.uploadRate = metrics->uploadRate;
            record.peerCount = metrics->peerCount;
            record.etaSeconds = estimateSeconds(metrics->totalSize, metrics->transferredSize, metrics->downloadRate);
            if (!metrics->infoHash.isEmpty()) record.infoHash = metrics->infoHash;
            if (!metrics->trackers.isEmpty()) record.trackers = metrics->trackers;
            return true;
        });
        if (!applied) continue;
        ++updated;

        if (percent < 100.0) continue;
        DownloadError error;
        if (!m_store.transition(id, DownloadStatus::Active, DownloadStatus::Completed, std::nullopt, &error)) {
            qWarning() << "Cannot complete download" << id << ":" << error.message;
            continue;
        }
        if (const auto record = m_store.get(id)) {
            qInfo() << "Download completed" << id << record->displayName;
            completed.append(*record);
        }
    }

    if (completed.isEmpty()) return updated;

    m_store.persist();

    CompletionHandler handler;
    {
        QMutexLocker locker(&m_handlerMutex);
        handler = m_completionHandler;
    }
    if (handler) {
        for (const DownloadRecord& record : std::as_const(completed)) handler(record);
    }
    return updated;
}
