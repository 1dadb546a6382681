/*!
 * @file        storagemonitor.hpp
 * @brief       Free-space monitoring, admission gate and staging cleanup.
 * @details     Samples the staging volume and every catalog destination volume
 *              on an adaptive interval and classifies each one as Normal,
 *              Warning or Critical. A volume that went critical stays critical
 *              until its free space rises above the recovery threshold, which
 *              keeps the admission gate from flapping around the critical
 *              threshold.
 *
 *              Also provides the staging cleanup operations (orphaned and
 *              expired job directories).
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_STORAGEMONITOR_HPP
#define BARAN_CORE_STORAGEMONITOR_HPP

#include "catalog.hpp"
#include "services/periodictask.hpp"

#include <QDateTime>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QVector>
#include <QtGlobal>

#include <chrono>
#include <functional>
#include <optional>

/**
 * @brief Health level of a volume.
 */
enum class StorageHealth {
    Normal,     //!< @brief Above the warning threshold.
    Warning,    //!< @brief Below the warning threshold.
    Critical    //!< @brief Below the critical threshold, or not yet recovered.
};

/**
 * @brief Returns "Normal", "Warning" or "Critical".
 */
QString storageHealthName(StorageHealth health);

/**
 * @brief State of one monitored volume, rebuilt on every check.
 */
struct VolumeStatus {
    QString path;                               //!< @brief Volume root path.
    qint64 availableBytes = 0;                  //!< @brief Free bytes available to the process.
    qint64 totalBytes = 0;                      //!< @brief Volume capacity.
    StorageHealth health = StorageHealth::Normal; //!< @brief Health level.
    bool isStagingVolume = false;               //!< @brief Holds the staging directory.
};

/**
 * @brief Raw measurement of the volume holding a path.
 */
struct VolumeSample {
    QString rootPath;           //!< @brief Root of the volume (used for de-duplication).
    qint64 availableBytes = 0;  //!< @brief Free bytes.
    qint64 totalBytes = 0;      //!< @brief Capacity.
};

/**
 * @brief Measures the volume holding a path, std::nullopt if it cannot be sampled.
 */
using VolumeProbe = std::function<std::optional<VolumeSample>(const QString& path)>;

/**
 * @brief Thresholds and check cadence.
 */
struct StorageSettings {
    qint64 warningThresholdBytes = 10737418240LL;   //!< @brief 10 GiB.
    qint64 criticalThresholdBytes = 2147483648LL;   //!< @brief 2 GiB.
    qint64 recoveryThresholdBytes = 16106127360LL;  //!< @brief 15 GiB, must exceed the critical threshold.
    std::chrono::milliseconds activeInterval { 60000 };  //!< @brief Check interval while downloads are active.
    std::chrono::milliseconds idleInterval { 300000 };   //!< @brief Check interval otherwise.
};

/**
 * @brief Outcome of a cleanup run.
 */
struct CleanupResult {
    int removed = 0;            //!< @brief Directories removed.
    qint64 bytesFreed = 0;      //!< @brief Bytes those directories held.

    CleanupResult& operator+=(const CleanupResult& other)
    {
        removed += other.removed;
        bytesFreed += other.bytesFreed;
        return *this;
    }
};

/**
 * @brief Volume monitor and admission gate.
 */
class StorageMonitor {
public:
    /**
     * @brief Creates a stopped monitor.
     * @param stagingDirectory Root of all job staging directories.
     * @param settings Thresholds and intervals.
     * @param catalog Optional catalog whose destination volumes are monitored too.
     * @param probe Volume sampler, defaults to systemProbe().
     */
    StorageMonitor(const QString& stagingDirectory, const StorageSettings& settings,
                   CatalogService* catalog = nullptr, VolumeProbe probe = VolumeProbe());

    ~StorageMonitor();

    /**
     * @brief Callback telling whether any download is active; selects the check interval.
     */
    void setActivityProbe(std::function<bool()> isActive);

    /**
     * @brief Callback invoked with the new gate state whenever it flips.
     */
    void setGateObserver(std::function<void(bool critical)> observer);

    /**
     * @brief Starts periodic checks on a background thread.
     */
    void start();

    /**
     * @brief Stops periodic checks and joins the thread.
     */
    void stop();

    /**
     * @brief Samples all relevant volumes and updates the gate.
     */
    void checkNow();

    /**
     * @brief Whether any monitored volume is critical. Blocks admissions and imports.
     */
    bool isCritical() const;

    /**
     * @brief Volume states computed by the last check, staging volume first.
     */
    QVector<VolumeStatus> volumes() const;

    /**
     * @brief Checks that the volume holding @p path has at least @p requiredBytes free.
     * @param errorMessage Optional description when the answer is no.
     */
    bool hasSufficientSpace(const QString& path, qint64 requiredBytes, QString* errorMessage = nullptr) const;

    /**
     * @brief Removes staging subdirectories whose name is not in @p validIds.
     */
    CleanupResult cleanupOrphaned(const QSet<QString>& validIds);

    /**
     * @brief Removes staging subdirectories last modified before @p cutoff.
     * @param cutoff Age limit.
     * @param protectedIds Directory names that are never removed.
     */
    CleanupResult cleanupOlderThan(const QDateTime& cutoff, const QSet<QString>& protectedIds = QSet<QString>());

    /**
     * @brief Samples a path with QStorageInfo, walking up to the nearest existing ancestor.
     */
    static std::optional<VolumeSample> systemProbe(const QString& path);

    const StorageSettings& settings() const { return m_settings; }
    QString stagingDirectory() const { return m_stagingDirectory; }

private:
    template <typename Predicate>
    CleanupResult removeStagingDirectories(const char* reason, Predicate shouldRemove);

    QString m_stagingDirectory;                 //!< @brief Staging root.
    StorageSettings m_settings;                 //!< @brief Thresholds and intervals.
    CatalogService* m_catalog = nullptr;        //!< @brief Destination source, not owned.
    VolumeProbe m_probe;                        //!< @brief Volume sampler.

    QMutex m_checkMutex;                        //!< @brief Serializes checkNow() and cleanups.
    mutable QMutex m_mutex;                     //!< @brief Guards the state below.
    QVector<VolumeStatus> m_volumes;            //!< @brief Last check result.
    QSet<QString> m_latched;                    //!< @brief Roots latched critical until recovery.
    bool m_critical = false;                    //!< @brief Gate state.
    std::function<bool()> m_activityProbe;      //!< @brief Interval selector.
    std::function<void(bool)> m_gateObserver;   //!< @brief Gate change callback.

    PeriodicTask m_task;                        //!< @brief Check loop.
};

#endif // BARAN_CORE_STORAGEMONITOR_HPP
