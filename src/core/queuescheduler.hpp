/*!
 * @file        queuescheduler.hpp
 * @brief       Admission control and user controls for download jobs.
 * @details     The scheduler admits Queued records onto the transfer engine in
 *              FIFO order while fewer than the configured number of records
 *              are Active and the storage gate is open. A failed start marks
 *              the record Failed and the pass continues with the next one.
 *
 *              Whole admission passes are serialized by a pass lock. Pause,
 *              resume and cancel take the same lock, so a control operation
 *              never interleaves with an admission of the same record. Engine
 *              calls run without holding the record collection lock; the
 *              record's eligibility is re-checked when it is marked Active.
 *
 *              Passes run synchronously through runAdmissionPass() or on the
 *              scheduler's own thread through requestPass().
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_QUEUESCHEDULER_HPP
#define BARAN_CORE_QUEUESCHEDULER_HPP

#include "downloaderror.hpp"
#include "recordstore.hpp"
#include "storagemonitor.hpp"
#include "transferengine.hpp"
#include "services/periodictask.hpp"

#include <QMutex>

#include <atomic>
#include <chrono>

/**
 * @brief FIFO admission scheduler with a concurrency limit.
 */
class QueueScheduler {
public:
    /**
     * @brief Creates a scheduler; all references must outlive it.
     * @param store Record collection.
     * @param storage Admission gate.
     * @param engine Transfer engine.
     * @param maxConcurrent Largest number of Active records.
     * @param passInterval Period of the safety-net pass on the scheduler thread.
     */
    QueueScheduler(RecordStore& store, StorageMonitor& storage, TransferEngine& engine,
                   int maxConcurrent, std::chrono::milliseconds passInterval = std::chrono::seconds(30));

    ~QueueScheduler();

    /**
     * @brief Starts the scheduler thread and runs a first pass.
     */
    void start();

    /**
     * @brief Stops the scheduler thread; waits for a pass in progress.
     */
    void stop();

    /**
     * @brief Asks the scheduler thread for a pass. Requests coalesce.
     */
    void requestPass();

    /**
     * @brief Runs one admission pass on the calling thread.
     * @return Number of records admitted.
     */
    int runAdmissionPass();

    /**
     * @brief Pauses an Active record. Pausing a Paused record succeeds without effect.
     */
    bool pause(const QString& id, DownloadError* error = nullptr);

    /**
     * @brief Resumes a Paused record if a concurrency slot is free.
     *
     * Resuming an Active record succeeds without effect. When the engine has
     * no session for the record (for example after a restart) a new session
     * is started instead.
     */
    bool resume(const QString& id, DownloadError* error = nullptr);

    /**
     * @brief Stops engine activity for a record and removes it.
     * @param id Record id.
     * @param deleteFiles Also remove the staging directory.
     * @param error NotFoundError for unknown ids, ConflictError while importing.
     */
    bool cancel(const QString& id, bool deleteFiles, DownloadError* error = nullptr);

    int maxConcurrent() const { return m_maxConcurrent.load(); }
    void setMaxConcurrent(int value);

private:
    RecordStore& m_store;                   //!< @brief Record collection.
    StorageMonitor& m_storage;              //!< @brief Admission gate.
    TransferEngine& m_engine;               //!< @brief Transfer engine.
    std::atomic<int> m_maxConcurrent;       //!< @brief Concurrency limit.
    QMutex m_passMutex;                     //!< @brief Serializes passes and control operations.
    PeriodicTask m_task;                    //!< @brief Scheduler thread.
};

#endif // BARAN_CORE_QUEUESCHEDULER_HPP
