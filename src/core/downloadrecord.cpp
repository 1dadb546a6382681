#include "downloadrecord.hpp"

#include <QJsonArray>
#include <QJsonValue>

namespace {

QJsonValue optionalString(const std::optional<QString>& value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonValue dateTimeValue(const QDateTime& value)
{
    if (!value.isValid()) return QJsonValue(QJsonValue::Null);
    return value.toUTC().toString(Qt::ISODateWithMs);
}

std::optional<QString> readOptionalString(const QJsonObject& obj, const QString& key)
{
    const QJsonValue v = obj.value(key);
    if (!v.isString()) return std::nullopt;
    return v.toString();
}

QDateTime readDateTime(const QJsonObject& obj, const QString& key)
{
    const QJsonValue v = obj.value(key);
    if (!v.isString()) return QDateTime();
    QDateTime dt = QDateTime::fromString(v.toString(), Qt::ISODateWithMs);
    if (!dt.isValid()) return QDateTime();
    return dt.toUTC();
}

} // namespace

QString statusToString(DownloadStatus status)
{
    switch (status) {
    case DownloadStatus::Queued: return QStringLiteral("Queued");
    case DownloadStatus::Active: return QStringLiteral("Active");
    case DownloadStatus::Paused: return QStringLiteral("Paused");
    case DownloadStatus::Completed: return QStringLiteral("Completed");
    case DownloadStatus::Failed: return QStringLiteral("Failed");
    case DownloadStatus::Importing: return QStringLiteral("Importing");
    case DownloadStatus::Imported: return QStringLiteral("Imported");
    }
    return QString();
}

std::optional<DownloadStatus> statusFromString(const QString& name)
{
    static const DownloadStatus all[] = {
        DownloadStatus::Queued, DownloadStatus::Active, DownloadStatus::Paused,
        DownloadStatus::Completed, DownloadStatus::Failed, DownloadStatus::Importing,
        DownloadStatus::Imported
    };
    for (DownloadStatus s : all) {
        if (statusToString(s).compare(name, Qt::CaseInsensitive) == 0) return s;
    }
    return std::nullopt;
}

bool isTransitionAllowed(DownloadStatus from, DownloadStatus to)
{
    if (from == to) return true;
    if (to == DownloadStatus::Failed) return true;

    switch (from) {
    case DownloadStatus::Queued:
        return to == DownloadStatus::Active;
    case DownloadStatus::Active:
        return to == DownloadStatus::Paused || to == DownloadStatus::Completed;
    case DownloadStatus::Paused:
        return to == DownloadStatus::Active;
    case DownloadStatus::Completed:
        return to == DownloadStatus::Importing;
    case DownloadStatus::Importing:
        return to == DownloadStatus::Imported || to == DownloadStatus::Completed;
    case DownloadStatus::Failed:
    case DownloadStatus::Imported:
        return false;
    }
    return false;
}

QJsonObject recordToJson(const DownloadRecord& record)
{
    QJsonObject obj;
    obj.insert("id", record.id);
    obj.insert("source", record.source);
    obj.insert("owner", record.owner);
    obj.insert("displayName", record.displayName);
    obj.insert("status", statusToString(record.status));
    obj.insert("totalSize", static_cast<double>(record.totalSize));
    obj.insert("transferredSize", static_cast<double>(record.transferredSize));
    obj.insert("percent", record.percent);
    obj.insert("downloadRate", static_cast<double>(record.downloadRate));
    obj.insert("uploadRate", static_cast<double>(record.uploadRate));
    obj.insert("peerCount", record.peerCount);
    obj.insert("estimatedTimeRemaining", record.etaSeconds ? QJsonValue(static_cast<double>(*record.etaSeconds))
                                                           : QJsonValue(QJsonValue::Null));
    obj.insert("stagingPath", record.stagingPath);
    obj.insert("destinationId", optionalString(record.destinationId));
    obj.insert("errorMessage", optionalString(record.errorMessage));
    obj.insert("createdAt", dateTimeValue(record.createdAt));
    obj.insert("completedAt", dateTimeValue(record.completedAt));
    obj.insert("importedAt", dateTimeValue(record.importedAt));
    obj.insert("infoHash", optionalString(record.infoHash));
    if (record.trackers) {
        obj.insert("trackers", QJsonArray::fromStringList(*record.trackers));
    } else {
        obj.insert("trackers", QJsonValue(QJsonValue::Null));
    }
    return obj;
}

std::optional<DownloadRecord> recordFromJson(const QJsonObject& obj, QString* errorMessage)
{
    DownloadRecord record;
    record.id = obj.value("id").toString();
    if (record.id.isEmpty()) {
        if (errorMessage) *errorMessage = QStringLiteral("record without id");
        return std::nullopt;
    }
    const auto status = statusFromString(obj.value("status").toString());
    if (!status) {
        if (errorMessage) *errorMessage = QStringLiteral("record %1 has unknown status '%2'")
                                              .arg(record.id, obj.value("status").toString());
        return std::nullopt;
    }
    record.status = *status;

    record.source = obj.value("source").toString();
    record.owner = obj.value("owner").toString();
    record.displayName = obj.value("displayName").toString();
    record.totalSize = static_cast<qint64>(obj.value("totalSize").toDouble(0));
    record.transferredSize = static_cast<qint64>(obj.value("transferredSize").toDouble(0));
    record.percent = qBound(0.0, obj.value("percent").toDouble(0), 100.0);
    record.downloadRate = static_cast<qint64>(obj.value("downloadRate").toDouble(0));
    record.uploadRate = static_cast<qint64>(obj.value("uploadRate").toDouble(0));
    record.peerCount = obj.value("peerCount").toInt(0);

    const QJsonValue eta = obj.value("estimatedTimeRemaining");
    if (eta.isDouble()) record.etaSeconds = static_cast<qint64>(eta.toDouble());

    record.stagingPath = obj.value("stagingPath").toString();
    record.destinationId = readOptionalString(obj, "destinationId");
    record.errorMessage = readOptionalString(obj, "errorMessage");
    record.createdAt = readDateTime(obj, "createdAt");
    record.completedAt = readDateTime(obj, "completedAt");
    record.importedAt = readDateTime(obj, "importedAt");
    record.infoHash = readOptionalString(obj, "infoHash");

    const QJsonValue trackers = obj.value("trackers");
    if (trackers.isArray()) {
        QStringList list;
        const QJsonArray arr = trackers.toArray();
        for (const QJsonValue& v : arr) list.append(v.toString());
        record.trackers = list;
    }
    return record;
}
