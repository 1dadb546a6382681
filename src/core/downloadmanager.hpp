/*!
 * @file        downloadmanager.hpp
 * @brief       Central download orchestration façade.
 * @details     Wires the record store, storage monitor, queue scheduler,
 *              progress poller and import coordinator together and exposes the
 *              operations used by the surrounding application.
 *
 *              Responsibilities include:
 *              - Job lifecycle management (create, pause, resume, cancel, import)
 *              - Startup recovery from the persisted snapshot
 *              - Storage status reporting and staging cleanup
 *              - Deterministic shutdown of every background loop
 *
 *              Resources are acquired in startup() and released in shutdown(),
 *              which the destructor also runs.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_DOWNLOADMANAGER_HPP
#define BARAN_CORE_DOWNLOADMANAGER_HPP

#include "catalog.hpp"
#include "downloaderror.hpp"
#include "downloadrecord.hpp"
#include "guardedengine.hpp"
#include "importcoordinator.hpp"
#include "progresspoller.hpp"
#include "queuescheduler.hpp"
#include "recordstore.hpp"
#include "storagemonitor.hpp"
#include "transferengine.hpp"
#include "services/periodictask.hpp"
#include "services/settings.hpp"

#include <QObject>
#include <QString>
#include <QVector>

#include <atomic>
#include <memory>
#include <optional>

/**
 * @brief Central coordinator for all download jobs.
 *
 * All public methods are thread-safe. Signals are emitted from whichever
 * thread caused the change; connect with Qt::QueuedConnection (the default
 * across threads) when the receiver lives elsewhere.
 */
class DownloadManager : public QObject {

    Q_OBJECT

    //!< @brief Number of currently active (transferring) downloads.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY countsChanged)

    //!< @brief Number of queued (waiting) downloads.
    Q_PROPERTY(int queuedCount READ queuedCount NOTIFY countsChanged)

    //!< @brief Whether the storage gate currently blocks admissions.
    Q_PROPERTY(bool storageCritical READ storageCritical NOTIFY storageCriticalChanged)

public:
    /**
     * @brief Construct a new download manager.
     * @param settings Configuration.
     * @param engine Transfer engine, must outlive the manager.
     * @param catalog Content catalog, must outlive the manager.
     * @param probe Optional volume sampler, defaults to QStorageInfo.
     * @param parent Optional parent QObject.
     */
    DownloadManager(const DownloaderSettings& settings, TransferEngine& engine, CatalogService& catalog,
                    VolumeProbe probe = VolumeProbe(), QObject* parent = nullptr);

    /**
     * @brief Shuts down if still running.
     */
    ~DownloadManager() override;

    /**
     * @brief Initializes the engine, restores state and starts background work.
     * @param error EngineError if the engine cannot be initialized,
     *              PersistenceError if the staging directory cannot be created.
     * @return true when running.
     */
    bool startup(DownloadError* error = nullptr);

    /**
     * @brief Stops background work, drains imports, stops sessions and writes a final snapshot.
     *
     * Safe to call more than once.
     */
    void shutdown();

    /**
     * @brief Whether startup() succeeded and shutdown() has not run yet.
     */
    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Submits a new download.
     * @param source Magnet URI or descriptor file path.
     * @param owner Submitting identity.
     * @param destinationId Optional explicit catalog destination.
     * @param error ValidationError or ConflictError.
     * @return The new Queued record.
     */
    std::optional<DownloadRecord> createDownload(const QString& source, const QString& owner,
                                                 const QString& destinationId = QString(),
                                                 DownloadError* error = nullptr);

    /**
     * @brief Returns a record.
     * @param error NotFoundError for unknown ids.
     */
    std::optional<DownloadRecord> getDownload(const QString& id, DownloadError* error = nullptr) const;

    /**
     * @brief Returns all records, optionally filtered by status.
     */
    QVector<DownloadRecord> listDownloads(std::optional<DownloadStatus> filter = std::nullopt) const;

    /**
     * @brief Pauses an active download.
     */
    bool pauseDownload(const QString& id, DownloadError* error = nullptr);

    /**
     * @brief Resumes a paused download.
     */
    bool resumeDownload(const QString& id, DownloadError* error = nullptr);

    /**
     * @brief Cancels and removes a download.
     * @param id Record id.
     * @param deleteFiles Also remove staged data.
     * @param error NotFoundError or ConflictError.
     */
    bool cancelDownload(const QString& id, bool deleteFiles = true, DownloadError* error = nullptr);

    /**
     * @brief Queues an import of a Completed download regardless of the automatic import setting.
     */
    bool importDownload(const QString& id, DownloadError* error = nullptr);

    /**
     * @brief Volume states from the last storage check.
     */
    QVector<VolumeStatus> volumesStatus() const;

    /**
     * @brief Removes orphaned staging directories and, when enabled, expired ones.
     */
    CleanupResult triggerCleanup();

    int activeCount() const;
    int queuedCount() const;
    bool storageCritical() const;

    RecordStore& store() { return m_store; }
    StorageMonitor& storage() { return m_storage; }
    QueueScheduler& scheduler() { return m_scheduler; }
    ProgressPoller& poller() { return m_poller; }
    ImportCoordinator& importer() { return m_importer; }
    const DownloaderSettings& settings() const { return m_settings; }

signals:
    /**
     * @brief Emitted after a download was created.
     */
    void downloadCreated(const QString& id);

    /**
     * @brief Emitted after a download changed status.
     */
    void downloadStatusChanged(const QString& id, const QString& status);

    /**
     * @brief Emitted after a download was removed.
     */
    void downloadRemoved(const QString& id);

    /**
     * @brief Emitted when active or queued counts may have changed.
     */
    void countsChanged();

    /**
     * @brief Emitted when the storage gate flips.
     */
    void storageCriticalChanged(bool critical);

private:
    void onCompleted(const DownloadRecord& record);
    CleanupResult runRetentionCleanup();

    DownloaderSettings m_settings;          //!< @brief Configuration.
    GuardedEngine m_engine;                 //!< @brief Engine with bounded calls.
    CatalogService& m_catalog;              //!< @brief Content catalog.
    RecordStore m_store;                    //!< @brief Record collection.
    StorageMonitor m_storage;               //!< @brief Volume monitor and gate.
    QueueScheduler m_scheduler;             //!< @brief Admission control.
    ProgressPoller m_poller;                //!< @brief Progress loop.
    ImportCoordinator m_importer;           //!< @brief Import work queue.
    PeriodicTask m_cleanupTask;             //!< @brief Retention cleanup loop.
    std::atomic<bool> m_running { false };  //!< @brief Between startup() and shutdown().
    std::atomic<bool> m_engineReady { false }; //!< @brief Engine initialized and not shut down.
};

#endif // BARAN_CORE_DOWNLOADMANAGER_HPP
