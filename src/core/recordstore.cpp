#include "recordstore.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

#include <utility>

static constexpr int kSnapshotVersion = 1;

RecordStore::RecordStore(const QString& snapshotPath)
    : m_snapshotPath(snapshotPath)
{
}

bool RecordStore::readSnapshot(const QString& path, QVector<DownloadRecord>* records, int* skipped, QString* errorMessage)
{
    QFile file(path);
    if (!file.exists()) {
        if (errorMessage) *errorMessage = QStringLiteral("%1 does not exist").arg(path);
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) *errorMessage = QStringLiteral("%1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) *errorMessage = QStringLiteral("%1: %2").arg(path, parseError.errorString());
        return false;
    }
    const QJsonObject root = doc.object();
    const int version = root.value("version").toInt(0);
    if (version < 1 || version > kSnapshotVersion || !root.value("records").isArray()) {
        if (errorMessage) *errorMessage = QStringLiteral("%1: unsupported snapshot layout (version %2)").arg(path).arg(version);
        return false;
    }

    records->clear();
    const QJsonArray items = root.value("records").toArray();
    for (const QJsonValue& v : items) {
        QString why = QStringLiteral("not an object");
        std::optional<DownloadRecord> record;
        if (v.isObject()) record = recordFromJson(v.toObject(), &why);
        if (!record) {
            qWarning() << "Skipping malformed snapshot entry in" << path << why;
            if (skipped) ++*skipped;
            continue;
        }
        records->append(*record);
    }
    return true;
}

bool RecordStore::load(LoadResult* result, DownloadError* error)
{
    LoadResult summary;
    QVector<DownloadRecord> records;
    QString liveError;

    const bool liveExists = QFile::exists(m_snapshotPath);
    const bool backupExists = QFile::exists(backupPath());

    bool ok = readSnapshot(m_snapshotPath, &records, &summary.skipped, &liveError);
    if (!ok && backupExists) {
        if (liveExists) qWarning() << "Snapshot unreadable, falling back to backup:" << liveError;
        QString backupError;
        summary.skipped = 0;
        ok = readSnapshot(backupPath(), &records, &summary.skipped, &backupError);
        if (!ok) {
            qCritical() << "Snapshot backup unreadable:" << backupError;
            return setDownloadError(error, DownloadError::Kind::Persistence,
                                    QStringLiteral("Snapshot and backup unreadable: %1; %2").arg(liveError, backupError));
        }
        summary.usedBackup = true;
    } else if (!ok && liveExists) {
        qCritical() << "Snapshot unreadable:" << liveError;
        return setDownloadError(error, DownloadError::Kind::Persistence, liveError);
    }

    for (DownloadRecord& record : records) {
        if (record.status == DownloadStatus::Active) {
            record.status = DownloadStatus::Queued;
            record.downloadRate = 0;
            record.uploadRate = 0;
            record.peerCount = 0;
            record.etaSeconds.reset();
            ++summary.demotedActive;
        } else if (record.status == DownloadStatus::Importing) {
            record.status = DownloadStatus::Completed;
            record.errorMessage = QStringLiteral("Import interrupted by restart; manual import required");
            ++summary.demotedImporting;
        }
    }
    summary.loaded = records.size();

    {
        QMutexLocker locker(&m_mutex);
        m_records = records;
    }

    if (summary.loaded > 0 || summary.usedBackup) {
        qInfo() << "Restored" << summary.loaded << "download(s)"
                << "requeued:" << summary.demotedActive
                << "interrupted imports:" << summary.demotedImporting
                << (summary.usedBackup ? "(from backup)" : "");
    }
    if (result) *result = summary;
    return true;
}

bool RecordStore::save(DownloadError* error)
{
    QMutexLocker writeLocker(&m_writeMutex);

    QJsonArray items;
    {
        QMutexLocker locker(&m_mutex);
        for (const DownloadRecord& record : std::as_const(m_records)) {
            items.append(recordToJson(record));
        }
    }

    QJsonObject root;
    root.insert("version", kSnapshotVersion);
    root.insert("savedAt", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));
    root.insert("records", items);
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);

    const QString dir = QFileInfo(m_snapshotPath).absolutePath();
    if (!QDir().mkpath(dir)) {
        return setDownloadError(error, DownloadError::Kind::Persistence,
                                QStringLiteral("Cannot create state directory %1").arg(dir));
    }

    // Rotate only a previous generation that still parses, so a damaged live
    // file never replaces a good backup.
    QFile live(m_snapshotPath);
    if (live.exists() && live.open(QIODevice::ReadOnly)) {
        const QByteArray previous = live.readAll();
        live.close();
        QJsonParseError parseError;
        const QJsonDocument previousDoc = QJsonDocument::fromJson(previous, &parseError);
        if (parseError.error == QJsonParseError::NoError && previousDoc.isObject()) {
            QSaveFile backup(backupPath());
            if (!backup.open(QIODevice::WriteOnly) || backup.write(previous) != previous.size() || !backup.commit()) {
                qWarning() << "Failed to rotate snapshot backup" << backupPath() << backup.errorString();
            }
        }
    }

    QSaveFile file(m_snapshotPath);
    if (!file.open(QIODevice::WriteOnly)) {
        return setDownloadError(error, DownloadError::Kind::Persistence,
                                QStringLiteral("%1: %2").arg(m_snapshotPath, file.errorString()));
    }
    if (file.write(data) != data.size()) {
        const QString why = file.errorString();
        file.cancelWriting();
        return setDownloadError(error, DownloadError::Kind::Persistence,
                                QStringLiteral("%1: %2").arg(m_snapshotPath, why));
    }
    if (!file.commit()) {
        return setDownloadError(error, DownloadError::Kind::Persistence,
                                QStringLiteral("%1: %2").arg(m_snapshotPath, file.errorString()));
    }
    return true;
}

void RecordStore::persist()
{
    DownloadError error;
    if (!save(&error)) {
        qWarning() << error.kindName() << error.message;
    }
}

bool RecordStore::insert(const DownloadRecord& record, DownloadError* error)
{
    QMutexLocker locker(&m_mutex);
    if (indexOf(record.id) >= 0) {
        return setDownloadError(error, DownloadError::Kind::Conflict,
                                QStringLiteral("Download %1 already exists").arg(record.id));
    }
    m_records.append(record);
    return true;
}

std::optional<DownloadRecord> RecordStore::get(const QString& id, DownloadError* error) const
{
    QMutexLocker locker(&m_mutex);
    const int index = indexOf(id);
    if (index < 0) {
        setDownloadError(error, DownloadError::Kind::NotFound, QStringLiteral("Download %1 not found").arg(id));
        return std::nullopt;
    }
    return m_records.at(index);
}

QVector<DownloadRecord> RecordStore::list(std::optional<DownloadStatus> filter) const
{
    QMutexLocker locker(&m_mutex);
    if (!filter) return m_records;

    QVector<DownloadRecord> out;
    for (const DownloadRecord& record : m_records) {
        if (record.status == *filter) out.append(record);
    }
    return out;
}

QStringList RecordStore::ids(std::optional<DownloadStatus> filter) const
{
    QMutexLocker locker(&m_mutex);
    QStringList out;
    for (const DownloadRecord& record : m_records) {
        if (filter && record.status != *filter) continue;
        out.append(record.id);
    }
    return out;
}

int RecordStore::count(DownloadStatus status) const
{
    QMutexLocker locker(&m_mutex);
    int n = 0;
    for (const DownloadRecord& record : m_records) {
        if (record.status == status) ++n;
    }
    return n;
}

int RecordStore::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_records.size();
}

bool RecordStore::applyStatus(DownloadRecord& record, DownloadStatus status,
                              const std::optional<QString>& errorMessage, DownloadError* error)
{
    if (!isTransitionAllowed(record.status, status)) {
        return setDownloadError(error, DownloadError::Kind::Conflict,
                                QStringLiteral("Download %1 cannot move from %2 to %3")
                                    .arg(record.id, statusToString(record.status), statusToString(status)));
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    record.status = status;
    record.errorMessage = errorMessage;

    if (status == DownloadStatus::Completed) {
        if (!record.completedAt.isValid()) record.completedAt = now;
        record.percent = 100.0;
        if (record.totalSize > 0) record.transferredSize = record.totalSize;
        record.downloadRate = 0;
        record.uploadRate = 0;
        record.etaSeconds.reset();
    } else if (status == DownloadStatus::Imported) {
        record.importedAt = now;
    } else if (status == DownloadStatus::Paused || status == DownloadStatus::Failed) {
        record.downloadRate = 0;
        record.uploadRate = 0;
        record.etaSeconds.reset();
    }
    return true;
}

bool RecordStore::updateStatus(const QString& id, DownloadStatus status,
                               const std::optional<QString>& errorMessage, DownloadError* error)
{
    DownloadRecord changed;
    {
        QMutexLocker locker(&m_mutex);
        const int index = indexOf(id);
        if (index < 0) {
            return setDownloadError(error, DownloadError::Kind::NotFound,
                                    QStringLiteral("Download %1 not found").arg(id));
        }
        DownloadRecord& record = m_records[index];
        if (!applyStatus(record, status, errorMessage, error)) return false;
        changed = record;
    }
    notify(changed);
    return true;
}

bool RecordStore::transition(const QString& id, DownloadStatus expected, DownloadStatus status,
                             const std::optional<QString>& errorMessage, DownloadError* error)
{
    DownloadRecord changed;
    {
        QMutexLocker locker(&m_mutex);
        const int index = indexOf(id);
        if (index < 0) {
            return setDownloadError(error, DownloadError::Kind::NotFound,
                                    QStringLiteral("Download %1 not found").arg(id));
        }
        DownloadRecord& record = m_records[index];
        if (record.status != expected) {
            return setDownloadError(error, DownloadError::Kind::Conflict,
                                    QStringLiteral("Download %1 is %2, expected %3")
                                        .arg(id, statusToString(record.status), statusToString(expected)));
        }
        if (!applyStatus(record, status, errorMessage, error)) return false;
        changed = record;
    }
    notify(changed);
    return true;
}

bool RecordStore::update(const QString& id, const std::function<bool(DownloadRecord&)>& mutator)
{
    QMutexLocker locker(&m_mutex);
    const int index = indexOf(id);
    if (index < 0) return false;
    return mutator(m_records[index]);
}

std::optional<DownloadRecord> RecordStore::take(const QString& id,
                                                const std::function<bool(const DownloadRecord&)>& predicate)
{
    QMutexLocker locker(&m_mutex);
    const int index = indexOf(id);
    if (index < 0) return std::nullopt;
    if (predicate && !predicate(m_records.at(index))) return std::nullopt;
    return m_records.takeAt(index);
}

std::optional<DownloadRecord> RecordStore::nextAdmissible(int activeLimit) const
{
    QMutexLocker locker(&m_mutex);
    int active = 0;
    const DownloadRecord* oldest = nullptr;
    for (const DownloadRecord& record : m_records) {
        if (record.status == DownloadStatus::Active) {
            ++active;
            continue;
        }
        if (record.status != DownloadStatus::Queued) continue;
        if (!oldest || record.createdAt < oldest->createdAt) oldest = &record;
    }
    if (active >= activeLimit || !oldest) return std::nullopt;
    return *oldest;
}

void RecordStore::setStatusObserver(StatusObserver observer)
{
    QMutexLocker locker(&m_observerMutex);
    m_observer = std::move(observer);
}

int RecordStore::indexOf(const QString& id) const
{
    for (int i = 0; i < m_records.size(); ++i) {
        if (m_records.at(i).id == id) return i;
    }
    return -1;
}

void RecordStore::notify(const DownloadRecord& record)
{
    StatusObserver observer;
    {
        QMutexLocker locker(&m_observerMutex);
        observer = m_observer;
    }
    if (observer) observer(record);
}
