/*!
 * @file        downloadrecord.hpp
 * @brief       Download job record and lifecycle status.
 * @details     A DownloadRecord describes one submitted transfer job: its
 *              identity, lifecycle status, live progress figures, staging
 *              placement, diagnostics and timestamps. Records are plain values;
 *              the RecordStore owns the authoritative collection.
 *
 *              Status transitions follow a forward-only lifecycle with the
 *              exception of the Paused/Active cycle and the any-state to
 *              Failed transition.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_DOWNLOADRECORD_HPP
#define BARAN_CORE_DOWNLOADRECORD_HPP

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <optional>

/**
 * @brief Lifecycle status of a download job.
 */
enum class DownloadStatus {
    Queued,     //!< @brief Waiting for an admission slot.
    Active,     //!< @brief Transferring on the engine.
    Paused,     //!< @brief Suspended by the operator.
    Completed,  //!< @brief Fully transferred, waiting for (or past a failed) import.
    Failed,     //!< @brief Terminal failure.
    Importing,  //!< @brief Being relocated into the catalog.
    Imported    //!< @brief Relocated into the catalog.
};

/**
 * @brief One submitted transfer job.
 */
struct DownloadRecord {
    QString id;                                 //!< @brief Unique id, immutable.
    QString source;                             //!< @brief Magnet URI or descriptor path, immutable.
    QString owner;                              //!< @brief Submitting identity, immutable.
    QString displayName;                        //!< @brief Sanitized name derived from the source.
    DownloadStatus status = DownloadStatus::Queued; //!< @brief Lifecycle status.

    qint64 totalSize = 0;                       //!< @brief Total bytes wanted.
    qint64 transferredSize = 0;                 //!< @brief Bytes received so far.
    double percent = 0.0;                       //!< @brief Progress in the range 0-100.
    qint64 downloadRate = 0;                    //!< @brief Download rate in bytes/sec.
    qint64 uploadRate = 0;                      //!< @brief Upload rate in bytes/sec.
    int peerCount = 0;                          //!< @brief Connected peers.
    std::optional<qint64> etaSeconds;           //!< @brief Estimated seconds remaining.

    QString stagingPath;                        //!< @brief Staging directory, immutable.
    std::optional<QString> destinationId;       //!< @brief Explicit catalog destination.
    std::optional<QString> errorMessage;        //!< @brief Last diagnostic.

    QDateTime createdAt;                        //!< @brief Creation time (UTC).
    QDateTime completedAt;                      //!< @brief Completion time, null until completed.
    QDateTime importedAt;                       //!< @brief Import time, null until imported.

    std::optional<QString> infoHash;            //!< @brief Content fingerprint reported by the engine.
    std::optional<QStringList> trackers;        //!< @brief Tracker URLs reported by the engine.

    bool operator==(const DownloadRecord& other) const = default;
};

/**
 * @brief Returns the persisted name of a status ("Queued", "Active", ...).
 */
QString statusToString(DownloadStatus status);

/**
 * @brief Parses a persisted status name.
 * @return The status, or std::nullopt for unknown names.
 */
std::optional<DownloadStatus> statusFromString(const QString& name);

/**
 * @brief Checks whether the lifecycle allows moving from @p from to @p to.
 *
 * Re-asserting the current status and moving to Failed are always allowed.
 */
bool isTransitionAllowed(DownloadStatus from, DownloadStatus to);

/**
 * @brief Serializes a record into a JSON object.
 *
 * Every field is written. Absent optional values and null timestamps are
 * written as JSON null.
 */
QJsonObject recordToJson(const DownloadRecord& record);

/**
 * @brief Restores a record from a JSON object.
 * @param obj Object produced by recordToJson().
 * @param errorMessage Optional output describing why the object was rejected.
 * @return The record, or std::nullopt if the id or status is missing or invalid.
 */
std::optional<DownloadRecord> recordFromJson(const QJsonObject& obj, QString* errorMessage = nullptr);

#endif // BARAN_CORE_DOWNLOADRECORD_HPP
