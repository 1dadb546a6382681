#include "category_utils.hpp"

#include <QDirIterator>
#include <QFileInfo>

namespace baran::utils {

QStringList videoExtensions()
{
    return { "mp4", "mkv", "avi", "mov", "wmv", "flv", "webm", "m4v", "mpg", "mpeg", "ts" };
}

QStringList audioExtensions()
{
    return { "mp3", "flac", "m4a", "aac", "ogg", "wma", "wav", "opus" };
}

MediaClass detectMediaClass(const QString& filePath)
{
    const QString lower = filePath.toLower();
    const int dot = lower.lastIndexOf('.');
    const QString ext = dot >= 0 ? lower.mid(dot + 1) : QString();
    if (ext.isEmpty()) return MediaClass::Unknown;

    if (videoExtensions().contains(ext)) return MediaClass::Video;
    if (audioExtensions().contains(ext)) return MediaClass::Audio;
    return MediaClass::Unknown;
}

MediaClass classifyDirectory(const QString& dirPath)
{
    int videoCount = 0;
    int audioCount = 0;

    QDirIterator it(dirPath, QDir::Files | QDir::Hidden | QDir::NoSymLinks, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        switch (detectMediaClass(path)) {
        case MediaClass::Video: ++videoCount; break;
        case MediaClass::Audio: ++audioCount; break;
        case MediaClass::Unknown: break;
        }
    }

    if (videoCount > audioCount) return MediaClass::Video;
    if (audioCount > videoCount) return MediaClass::Audio;
    return MediaClass::Unknown;
}

QString mediaClassName(MediaClass mediaClass)
{
    switch (mediaClass) {
    case MediaClass::Video: return QStringLiteral("video");
    case MediaClass::Audio: return QStringLiteral("audio");
    case MediaClass::Unknown: break;
    }
    return QStringLiteral("unknown");
}

MediaClass mediaClassFromName(const QString& name)
{
    const QString lower = name.trimmed().toLower();
    if (lower == QLatin1String("video")) return MediaClass::Video;
    if (lower == QLatin1String("audio")) return MediaClass::Audio;
    return MediaClass::Unknown;
}

} // namespace baran::utils
