#include "download_utils.hpp"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QUrl>
#include <QUrlQuery>

namespace baran::utils {

static constexpr int kMaxDisplayNameLength = 200;

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

QString decodeQueryValue(const QString& value)
{
    QString v = value;
    v.replace('+', ' ');
    return QUrl::fromPercentEncoding(v.toUtf8());
}

bool isMagnetUri(const QString& source)
{
    const QString trimmed = source.trimmed();
    if (!trimmed.startsWith(QStringLiteral("magnet:?"), Qt::CaseInsensitive)) return false;

    const QUrlQuery query(trimmed.mid(8));
    const auto items = query.queryItems(QUrl::FullyDecoded);
    for (const auto& item : items) {
        if (item.first.compare(QStringLiteral("xt"), Qt::CaseInsensitive) != 0) continue;
        if (item.second.startsWith(QStringLiteral("urn:"), Qt::CaseInsensitive) && item.second.size() > 4) return true;
    }
    return false;
}

bool isTorrentFilePath(const QString& source)
{
    const QString path = normalizeFilePath(source.trimmed());
    if (path.isEmpty()) return false;
    if (!path.endsWith(QStringLiteral(".torrent"), Qt::CaseInsensitive)) return false;
    QFileInfo info(path);
    return info.exists() && info.isFile() && info.isReadable();
}

QString sanitizeDisplayName(const QString& name)
{
    static const QString reserved = QStringLiteral("<>:\"/\\|?*");

    QString out;
    out.reserve(name.size());
    for (const QChar ch : name) {
        if (ch.category() == QChar::Other_Control) continue;
        out.append(reserved.contains(ch) ? QChar('_') : ch);
    }

    out = out.trimmed();
    while (out.endsWith('.')) out.chop(1);
    if (out.size() > kMaxDisplayNameLength) out = out.left(kMaxDisplayNameLength).trimmed();
    if (out.isEmpty() || out == QLatin1String("..")) return QStringLiteral("Unknown");
    return out;
}

QString displayNameFromSource(const QString& source)
{
    const QString trimmed = source.trimmed();
    if (trimmed.startsWith(QStringLiteral("magnet:?"), Qt::CaseInsensitive)) {
        const QUrlQuery query(trimmed.mid(8));
        const auto items = query.queryItems(QUrl::FullyEncoded);
        for (const auto& item : items) {
            if (item.first.compare(QStringLiteral("dn"), Qt::CaseInsensitive) == 0) {
                return sanitizeDisplayName(decodeQueryValue(item.second));
            }
        }
        return sanitizeDisplayName(QString());
    }
    const QString path = normalizeFilePath(trimmed);
    return sanitizeDisplayName(QFileInfo(path).completeBaseName());
}

qint64 directorySize(const QString& dirPath)
{
    qint64 total = 0;
    QDirIterator it(dirPath, QDir::Files | QDir::Hidden | QDir::NoSymLinks, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        total += it.fileInfo().size();
    }
    return total;
}

QString timestampedUniquePath(const QString& path, const QDateTime& now)
{
    if (!QFileInfo::exists(path)) return path;

    const QString stamped = QStringLiteral("%1_%2").arg(path, now.toUTC().toString(QStringLiteral("yyyyMMddHHmmss")));
    if (!QFileInfo::exists(stamped)) return stamped;

    for (int i = 1; i < 10000; ++i) {
        const QString candidate = QStringLiteral("%1_%2").arg(stamped).arg(i);
        if (!QFileInfo::exists(candidate)) return candidate;
    }
    return stamped;
}

bool copyDirectory(const QString& from, const QString& to, QString* errorMessage)
{
    QDir source(from);
    if (!source.exists()) {
        if (errorMessage) *errorMessage = QStringLiteral("Source directory does not exist: %1").arg(from);
        return false;
    }
    if (!QDir().mkpath(to)) {
        if (errorMessage) *errorMessage = QStringLiteral("Cannot create directory: %1").arg(to);
        return false;
    }

    const QFileInfoList entries = source.entryInfoList(QDir::Dirs | QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot);
    for (const QFileInfo& entry : entries) {
        const QString target = QDir(to).filePath(entry.fileName());
        if (entry.isDir() && !entry.isSymLink()) {
            if (!copyDirectory(entry.absoluteFilePath(), target, errorMessage)) return false;
            continue;
        }
        if (!QFile::copy(entry.absoluteFilePath(), target)) {
            if (errorMessage) *errorMessage = QStringLiteral("Cannot copy %1 to %2").arg(entry.absoluteFilePath(), target);
            return false;
        }
    }
    return true;
}

bool moveDirectory(const QString& from, const QString& to, bool* renamed, QString* errorMessage)
{
    if (renamed) *renamed = false;
    if (QFileInfo::exists(to)) {
        if (errorMessage) *errorMessage = QStringLiteral("Target already exists: %1").arg(to);
        return false;
    }
    const QString parent = QFileInfo(to).absolutePath();
    if (!QDir().mkpath(parent)) {
        if (errorMessage) *errorMessage = QStringLiteral("Cannot create directory: %1").arg(parent);
        return false;
    }

    if (QDir().rename(from, to)) {
        if (renamed) *renamed = true;
        return true;
    }
    return publishCopy(from, to, errorMessage);
}

bool publishCopy(const QString& from, const QString& to, QString* errorMessage)
{
    const QString partial = to + QStringLiteral(".partial");
    if (QFileInfo::exists(partial)) QDir(partial).removeRecursively();
    if (!copyDirectory(from, partial, errorMessage)) {
        QDir(partial).removeRecursively();
        return false;
    }
    if (!QDir().rename(partial, to)) {
        QDir(partial).removeRecursively();
        if (errorMessage) *errorMessage = QStringLiteral("Cannot publish %1").arg(to);
        return false;
    }
    if (!QDir(from).removeRecursively()) {
        qWarning() << "Published" << to << "but could not remove the source" << from;
    }
    return true;
}

} // namespace baran::utils
