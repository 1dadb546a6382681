#include "settings.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

namespace utils = baran::utils;

namespace {

constexpr qint64 kGiB = 1024LL * 1024LL * 1024LL;

std::chrono::milliseconds seconds(const QSettings& settings, const QString& key, std::chrono::milliseconds fallback)
{
    const qint64 value = settings.value(key, static_cast<qint64>(fallback.count() / 1000)).toLongLong();
    return std::chrono::milliseconds(value * 1000);
}

} // namespace

DownloaderSettings defaultDownloaderSettings()
{
    DownloaderSettings settings;
    QString baseDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (baseDir.isEmpty()) baseDir = QDir::currentPath();
    settings.stagingDirectory = QDir(baseDir).filePath(QStringLiteral("staging"));
    settings.stateFile = QDir(baseDir).filePath(QStringLiteral("downloads.json"));
    return settings;
}

QStringList validateDownloaderSettings(DownloaderSettings& settings)
{
    QStringList warnings;

    if (settings.maxConcurrentDownloads < 1) {
        warnings << QStringLiteral("queue/maxConcurrentDownloads must be at least 1, using 1");
        settings.maxConcurrentDownloads = 1;
    }

    StorageSettings& storage = settings.storage;
    if (storage.criticalThresholdBytes < 0) {
        warnings << QStringLiteral("storage/criticalThresholdBytes is negative, using 0");
        storage.criticalThresholdBytes = 0;
    }
    if (storage.warningThresholdBytes < storage.criticalThresholdBytes) {
        warnings << QStringLiteral("storage/warningThresholdBytes is below the critical threshold, raising it");
        storage.warningThresholdBytes = storage.criticalThresholdBytes;
    }
    if (storage.recoveryThresholdBytes <= storage.criticalThresholdBytes) {
        const qint64 gap = storage.warningThresholdBytes - storage.criticalThresholdBytes;
        storage.recoveryThresholdBytes = storage.criticalThresholdBytes + (gap > 0 ? gap : kGiB);
        warnings << QStringLiteral("storage/recoveryThresholdBytes must exceed the critical threshold, using %1")
                        .arg(storage.recoveryThresholdBytes);
    }
    if (storage.activeInterval.count() <= 0 || storage.idleInterval.count() <= 0) {
        warnings << QStringLiteral("storage check intervals must be positive, using defaults");
        storage.activeInterval = StorageSettings().activeInterval;
        storage.idleInterval = StorageSettings().idleInterval;
    }

    if (settings.importing.maxAttempts < 1) {
        warnings << QStringLiteral("import/retryAttempts must be at least 1, using 1");
        settings.importing.maxAttempts = 1;
    }
    if (settings.importing.baseDelay.count() < 0) {
        warnings << QStringLiteral("import/retryDelaySec is negative, using 0");
        settings.importing.baseDelay = std::chrono::milliseconds(0);
    }
    if (settings.cleanupRetentionDays < 1) {
        warnings << QStringLiteral("cleanup/retentionDays must be at least 1, using 1");
        settings.cleanupRetentionDays = 1;
    }
    if (settings.pollInterval.count() <= 0) {
        warnings << QStringLiteral("queue/pollIntervalMs must be positive, using 2000");
        settings.pollInterval = std::chrono::milliseconds(2000);
    }
    if (settings.passInterval.count() <= 0) {
        warnings << QStringLiteral("queue/passIntervalSec must be positive, using 30");
        settings.passInterval = std::chrono::milliseconds(30000);
    }
    if (settings.cleanupInterval.count() <= 0) {
        warnings << QStringLiteral("cleanup/intervalHours must be positive, using 24");
        settings.cleanupInterval = std::chrono::milliseconds(24 * 3600 * 1000);
    }
    if (settings.engineCallTimeout.count() <= 0) {
        warnings << QStringLiteral("queue/engineCallTimeoutSec must be positive, using 30");
        settings.engineCallTimeout = std::chrono::milliseconds(30000);
    }
    if (settings.engine.listenPort < 0 || settings.engine.listenPort > 65535) {
        warnings << QStringLiteral("engine/listenPort out of range, using 6881");
        settings.engine.listenPort = 6881;
    }
    return warnings;
}

bool loadDownloaderSettings(const QString& iniPath, DownloaderSettings* settings, QStringList* warnings, DownloadError* error)
{
    if (!QFileInfo::exists(iniPath)) {
        return setDownloadError(error, DownloadError::Kind::Validation,
                                QStringLiteral("Configuration file %1 does not exist").arg(iniPath));
    }

    QSettings ini(iniPath, QSettings::IniFormat);
    if (ini.status() != QSettings::NoError) {
        return setDownloadError(error, DownloadError::Kind::Validation,
                                QStringLiteral("Configuration file %1 is not readable").arg(iniPath));
    }

    DownloaderSettings out = defaultDownloaderSettings();

    ini.beginGroup(QStringLiteral("paths"));
    out.stagingDirectory = ini.value(QStringLiteral("stagingDirectory"), out.stagingDirectory).toString();
    out.stateFile = ini.value(QStringLiteral("stateFile"), out.stateFile).toString();
    ini.endGroup();

    ini.beginGroup(QStringLiteral("queue"));
    out.maxConcurrentDownloads = ini.value(QStringLiteral("maxConcurrentDownloads"), out.maxConcurrentDownloads).toInt();
    out.passInterval = seconds(ini, QStringLiteral("passIntervalSec"), out.passInterval);
    out.pollInterval = std::chrono::milliseconds(
        ini.value(QStringLiteral("pollIntervalMs"), static_cast<qint64>(out.pollInterval.count())).toLongLong());
    out.engineCallTimeout = seconds(ini, QStringLiteral("engineCallTimeoutSec"), out.engineCallTimeout);
    ini.endGroup();

    ini.beginGroup(QStringLiteral("storage"));
    out.storage.warningThresholdBytes = ini.value(QStringLiteral("warningThresholdBytes"), out.storage.warningThresholdBytes).toLongLong();
    out.storage.criticalThresholdBytes = ini.value(QStringLiteral("criticalThresholdBytes"), out.storage.criticalThresholdBytes).toLongLong();
    out.storage.recoveryThresholdBytes = ini.value(QStringLiteral("recoveryThresholdBytes"), out.storage.recoveryThresholdBytes).toLongLong();
    out.storage.activeInterval = seconds(ini, QStringLiteral("checkIntervalActiveSec"), out.storage.activeInterval);
    out.storage.idleInterval = seconds(ini, QStringLiteral("checkIntervalIdleSec"), out.storage.idleInterval);
    ini.endGroup();

    ini.beginGroup(QStringLiteral("import"));
    out.importing.autoImport = ini.value(QStringLiteral("autoImport"), out.importing.autoImport).toBool();
    out.importing.removeAfterImport = ini.value(QStringLiteral("removeAfterImport"), out.importing.removeAfterImport).toBool();
    out.importing.maxAttempts = ini.value(QStringLiteral("retryAttempts"), out.importing.maxAttempts).toInt();
    out.importing.baseDelay = seconds(ini, QStringLiteral("retryDelaySec"), out.importing.baseDelay);
    out.importing.defaultDestinationId = ini.value(QStringLiteral("defaultDestinationId"), out.importing.defaultDestinationId).toString();
    ini.endGroup();

    ini.beginGroup(QStringLiteral("cleanup"));
    out.enableAutomaticCleanup = ini.value(QStringLiteral("enableAutomaticCleanup"), out.enableAutomaticCleanup).toBool();
    out.cleanupRetentionDays = ini.value(QStringLiteral("retentionDays"), out.cleanupRetentionDays).toInt();
    out.cleanupInterval = std::chrono::milliseconds(
        ini.value(QStringLiteral("intervalHours"), 24).toLongLong() * 3600 * 1000);
    ini.endGroup();

    ini.beginGroup(QStringLiteral("engine"));
    out.engine.listenPort = ini.value(QStringLiteral("listenPort"), out.engine.listenPort).toInt();
    out.engine.enableDht = ini.value(QStringLiteral("enableDht"), out.engine.enableDht).toBool();
    out.engine.enablePex = ini.value(QStringLiteral("enablePex"), out.engine.enablePex).toBool();
    out.engine.enableEncryption = ini.value(QStringLiteral("enableEncryption"), out.engine.enableEncryption).toBool();
    out.engine.maxDownloadRate = ini.value(QStringLiteral("maxDownloadRate"), out.engine.maxDownloadRate).toLongLong();
    out.engine.maxUploadRate = ini.value(QStringLiteral("maxUploadRate"), out.engine.maxUploadRate).toLongLong();
    ini.endGroup();

    ini.beginGroup(QStringLiteral("catalog"));
    out.jellyfinUrl = ini.value(QStringLiteral("jellyfinUrl")).toString().trimmed();
    out.catalogApiKey = ini.value(QStringLiteral("apiKey")).toString();
    out.catalogRequestTimeout = seconds(ini, QStringLiteral("requestTimeoutSec"), out.catalogRequestTimeout);
    ini.endGroup();

    const int count = ini.beginReadArray(QStringLiteral("destinations"));
    for (int i = 0; i < count; ++i) {
        ini.setArrayIndex(i);
        CatalogDestination d;
        d.id = ini.value(QStringLiteral("id")).toString();
        d.name = ini.value(QStringLiteral("name"), d.id).toString();
        d.mediaClass = utils::mediaClassFromName(ini.value(QStringLiteral("class")).toString());
        d.paths = ini.value(QStringLiteral("paths")).toStringList();
        if (d.id.isEmpty() || d.paths.isEmpty()) {
            if (warnings) warnings->append(QStringLiteral("destinations/%1 ignored: id and paths are required").arg(i + 1));
            continue;
        }
        out.destinations.append(d);
    }
    ini.endArray();

    const QStringList corrections = validateDownloaderSettings(out);
    if (warnings) warnings->append(corrections);
    *settings = out;
    return true;
}
