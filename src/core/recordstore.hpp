/*!
 * @file        recordstore.hpp
 * @brief       Authoritative, persisted collection of download records.
 * @details     The RecordStore keeps every DownloadRecord in submission order
 *              behind a single mutex and persists the whole collection as one
 *              JSON snapshot.
 *
 *              Snapshot writes are atomic: the previous live file is rotated
 *              into a one-generation backup, then the new document is written
 *              through QSaveFile, so the live file always holds either the old
 *              or the new complete state. Loading falls back to the backup
 *              when the live file is missing or unreadable and demotes records
 *              that were interrupted by the previous shutdown.
 *
 *              Mutations never perform I/O while holding the collection lock.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_RECORDSTORE_HPP
#define BARAN_CORE_RECORDSTORE_HPP

#include "downloaderror.hpp"
#include "downloadrecord.hpp"

#include <QMutex>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>
#include <optional>

/**
 * @brief Thread-safe record collection with snapshot persistence.
 */
class RecordStore {
public:
    /**
     * @brief Summary of a load() call.
     */
    struct LoadResult {
        int loaded = 0;             //!< @brief Records restored.
        int skipped = 0;            //!< @brief Malformed entries ignored.
        int demotedActive = 0;      //!< @brief Active records re-queued.
        int demotedImporting = 0;   //!< @brief Interrupted imports set back to Completed.
        bool usedBackup = false;    //!< @brief The backup generation was used.
    };

    /**
     * @brief Observer invoked after a record changed status.
     */
    using StatusObserver = std::function<void(const DownloadRecord&)>;

    /**
     * @brief Creates an empty store persisting to @p snapshotPath.
     */
    explicit RecordStore(const QString& snapshotPath);

    /**
     * @brief Replaces the collection with the persisted snapshot.
     *
     * A missing snapshot (and backup) yields an empty store and succeeds.
     * Active records are demoted to Queued, Importing records to Completed
     * with a diagnostic.
     *
     * @param result Optional load summary.
     * @param error Set when both the live snapshot and the backup are unreadable.
     * @return false only if persisted state exists but could not be read.
     */
    bool load(LoadResult* result = nullptr, DownloadError* error = nullptr);

    /**
     * @brief Writes the snapshot now.
     * @param error Optional failure description.
     * @return true on success.
     */
    bool save(DownloadError* error = nullptr);

    /**
     * @brief Writes the snapshot and logs a failure instead of reporting it.
     */
    void persist();

    /**
     * @brief Appends a new record.
     * @return false with a ConflictError if the id is already taken.
     */
    bool insert(const DownloadRecord& record, DownloadError* error = nullptr);

    /**
     * @brief Returns a copy of a record.
     */
    std::optional<DownloadRecord> get(const QString& id, DownloadError* error = nullptr) const;

    /**
     * @brief Returns copies of all records, optionally filtered by status, in collection order.
     */
    QVector<DownloadRecord> list(std::optional<DownloadStatus> filter = std::nullopt) const;

    /**
     * @brief Returns the ids of all records, optionally filtered by status.
     */
    QStringList ids(std::optional<DownloadStatus> filter = std::nullopt) const;

    /**
     * @brief Number of records with a given status.
     */
    int count(DownloadStatus status) const;

    /**
     * @brief Total number of records.
     */
    int size() const;

    /**
     * @brief Moves a record to a new status.
     *
     * The transition is validated with isTransitionAllowed(). Entering
     * Completed stamps the completion time and finalises the progress
     * figures, entering Imported stamps the import time. The error message is
     * replaced by @p errorMessage.
     *
     * @return false with NotFoundError or ConflictError.
     */
    bool updateStatus(const QString& id, DownloadStatus status,
                      const std::optional<QString>& errorMessage = std::nullopt,
                      DownloadError* error = nullptr);

    /**
     * @brief Like updateStatus() but only if the record currently has status @p expected.
     * @return false with ConflictError if the status differs.
     */
    bool transition(const QString& id, DownloadStatus expected, DownloadStatus status,
                    const std::optional<QString>& errorMessage = std::nullopt,
                    DownloadError* error = nullptr);

    /**
     * @brief Applies @p mutator to a record under the collection lock.
     *
     * The mutator must not change the status, id or staging path and must
     * not call back into the store. It returns whether it changed anything.
     *
     * @return The mutator's result, or false if the record does not exist.
     */
    bool update(const QString& id, const std::function<bool(DownloadRecord&)>& mutator);

    /**
     * @brief Removes a record and returns it.
     * @param id Record id.
     * @param predicate Optional check run under the lock; the record is kept if it returns false.
     */
    std::optional<DownloadRecord> take(const QString& id,
                                       const std::function<bool(const DownloadRecord&)>& predicate = {});

    /**
     * @brief Returns the oldest Queued record if fewer than @p activeLimit records are Active.
     */
    std::optional<DownloadRecord> nextAdmissible(int activeLimit) const;

    /**
     * @brief Installs the status observer. Called outside the lock.
     */
    void setStatusObserver(StatusObserver observer);

    QString snapshotPath() const { return m_snapshotPath; }
    QString backupPath() const { return m_snapshotPath + QStringLiteral(".bak"); }

private:
    bool applyStatus(DownloadRecord& record, DownloadStatus status,
                     const std::optional<QString>& errorMessage, DownloadError* error);
    int indexOf(const QString& id) const;
    void notify(const DownloadRecord& record);

    static bool readSnapshot(const QString& path, QVector<DownloadRecord>* records, int* skipped, QString* errorMessage);

    QString m_snapshotPath;             //!< @brief Live snapshot file.
    mutable QMutex m_mutex;             //!< @brief Guards m_records.
    QMutex m_writeMutex;                //!< @brief Serializes snapshot writes.
    QVector<DownloadRecord> m_records;  //!< @brief Records in submission order.
    QMutex m_observerMutex;             //!< @brief Guards m_observer.
    StatusObserver m_observer;          //!< @brief Status change callback.
};

#endif // BARAN_CORE_RECORDSTORE_HPP
