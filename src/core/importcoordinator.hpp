/*!
 * @file        importcoordinator.hpp
 * @brief       Relocation of completed downloads into the catalog.
 * @details     A completed download is classified (video, audio or unknown),
 *              matched to a catalog destination and moved out of staging into
 *              the destination's first folder. The catalog is then asked to
 *              rescan. Attempts that fail for transient reasons (storage gate,
 *              free space, move errors, catalog unreachable) are retried with
 *              exponential backoff; when all attempts are used up the record
 *              stays Completed with a diagnostic.
 *
 *              Imports run on a dedicated thread pool. shutdown() stops
 *              accepting work, interrupts backoff waits and waits for imports
 *              in progress; a move is never abandoned midway.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_IMPORTCOORDINATOR_HPP
#define BARAN_CORE_IMPORTCOORDINATOR_HPP

#include "catalog.hpp"
#include "recordstore.hpp"
#include "storagemonitor.hpp"

#include <QFuture>
#include <QList>
#include <QMutex>
#include <QReadWriteLock>
#include <QThreadPool>
#include <QWaitCondition>

#include <chrono>
#include <functional>
#include <optional>

/**
 * @brief Import policy.
 */
struct ImportSettings {
    bool autoImport = true;                             //!< @brief Import automatically on completion.
    bool removeAfterImport = false;                     //!< @brief Delete staging after a successful move.
    int maxAttempts = 3;                                //!< @brief Total attempts, at least 1.
    std::chrono::milliseconds baseDelay { 5000 };       //!< @brief Delay before the first retry.
    QString defaultDestinationId;                       //!< @brief Fallback destination.
};

/**
 * @brief Result of an import run.
 */
enum class ImportOutcome {
    Imported,       //!< @brief Moved into the catalog.
    Skipped,        //!< @brief Not eligible (status, setting or missing staging directory).
    NoDestination,  //!< @brief No catalog destination; record stays Completed.
    Failed,         //!< @brief Attempts exhausted; record stays Completed with a diagnostic.
    Interrupted     //!< @brief Shutdown interrupted a backoff wait.
};

/**
 * @brief Runs imports on a tracked work queue.
 */
class ImportCoordinator {
public:
    /**
     * @brief Waits for the given delay; returns false if the wait was interrupted.
     */
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    /**
     * @brief Creates a coordinator; all references must outlive it.
     */
    ImportCoordinator(RecordStore& store, StorageMonitor& storage, CatalogService& catalog,
                      const ImportSettings& settings);

    /**
     * @brief Shuts the work queue down.
     */
    ~ImportCoordinator();

    /**
     * @brief Replaces the backoff wait, mainly for tests.
     */
    void setSleeper(Sleeper sleeper);

    /**
     * @brief Queues an import.
     * @param id Record id.
     * @param manual Operator request; bypasses the automatic import setting.
     * @return false once shutdown() was called.
     */
    bool enqueue(const QString& id, bool manual = false);

    /**
     * @brief Runs the import procedure on the calling thread.
     */
    ImportOutcome importNow(const QString& id, bool manual = false);

    /**
     * @brief Waits until all queued imports have finished.
     */
    void waitForIdle();

    /**
     * @brief Rejects new work, interrupts backoff waits and waits for running imports.
     */
    void shutdown();

    /**
     * @brief Runs @p fn while no import is claiming or moving a staging directory.
     *
     * Records claimed before @p fn starts are already Importing when it runs.
     */
    void runExclusive(const std::function<void()>& fn);

    /**
     * @brief Picks the destination for a record.
     *
     * Order: the record's explicit destination, a destination serving
     * @p mediaClass, the configured default destination, the first
     * destination. Destinations without folders are ignored.
     *
     * @param record Record being imported.
     * @param mediaClass Detected content class.
     * @param errorMessage Why nothing was selected.
     * @param retryable Set to true when the catalog could not be queried.
     */
    std::optional<CatalogDestination> selectDestination(const DownloadRecord& record,
                                                        baran::utils::MediaClass mediaClass,
                                                        QString* errorMessage = nullptr,
                                                        bool* retryable = nullptr);

    /**
     * @brief Delay before retry number @p retry (1-based): base * 2^(retry-1).
     */
    static std::chrono::milliseconds backoffDelay(std::chrono::milliseconds base, int retry);

    const ImportSettings& settings() const { return m_settings; }

private:
    enum class AttemptResult { Success, Retry, NoDestination };

    AttemptResult runAttempt(const DownloadRecord& record, QString* errorMessage);
    void finish(const QString& id, DownloadStatus status, const std::optional<QString>& message);
    bool sleep(std::chrono::milliseconds delay);

    RecordStore& m_store;               //!< @brief Record collection.
    StorageMonitor& m_storage;          //!< @brief Space checks and gate.
    CatalogService& m_catalog;          //!< @brief Destinations and rescans.
    ImportSettings m_settings;          //!< @brief Import policy.

    QThreadPool m_pool;                 //!< @brief Import workers.
    QMutex m_mutex;                     //!< @brief Guards the fields below.
    QWaitCondition m_wake;              //!< @brief Interrupts backoff waits.
    bool m_stopping = false;            //!< @brief Set by shutdown().
    QList<QFuture<void>> m_pending;     //!< @brief Queued and running imports.
    Sleeper m_sleeper;                  //!< @brief Backoff wait override.
    QReadWriteLock m_stagingLock;       //!< @brief Shared by imports, exclusive for staging cleanup.
};

#endif // BARAN_CORE_IMPORTCOORDINATOR_HPP
