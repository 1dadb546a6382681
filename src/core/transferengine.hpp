/*!
 * @file        transferengine.hpp
 * @brief       Contract of the peer-to-peer transfer engine.
 * @details     The download core never talks to a transfer implementation
 *              directly. It drives jobs through this narrow interface: start,
 *              pause, resume and stop a session, query live progress and
 *              validate sources before a job is accepted.
 *
 *              Implementations must be safe to call from several threads.
 *              Calls may block; the core wraps them in GuardedEngine to bound
 *              the caller's wait.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_TRANSFERENGINE_HPP
#define BARAN_CORE_TRANSFERENGINE_HPP

#include "downloadrecord.hpp"

#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <optional>

/**
 * @brief Engine wide tuning options.
 */
struct EngineSettings {
    int listenPort = 6881;          //!< @brief Incoming connection port.
    qint64 maxDownloadRate = 0;     //!< @brief Global download limit in bytes/sec, 0 = unlimited.
    qint64 maxUploadRate = 0;       //!< @brief Global upload limit in bytes/sec, 0 = unlimited.
    bool enableDht = true;          //!< @brief Distributed hash table peer discovery.
    bool enablePex = true;          //!< @brief Peer exchange extension.
    bool enableEncryption = true;   //!< @brief Allow encrypted peer connections.
};

/**
 * @brief Live figures of one engine session.
 */
struct TransferMetrics {
    qint64 totalSize = 0;           //!< @brief Total bytes wanted.
    qint64 transferredSize = 0;     //!< @brief Bytes received and verified.
    double percent = 0.0;           //!< @brief Progress 0-100.
    qint64 downloadRate = 0;        //!< @brief Payload download rate in bytes/sec.
    qint64 uploadRate = 0;          //!< @brief Payload upload rate in bytes/sec.
    int peerCount = 0;              //!< @brief Connected peers.
    QString infoHash;               //!< @brief Content fingerprint, empty while unknown.
    QStringList trackers;           //!< @brief Tracker URLs, empty while unknown.
};

/**
 * @brief Abstract transfer engine driven by the download core.
 */
class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    /**
     * @brief Prepares the engine for use.
     * @param settings Engine options.
     * @param errorMessage Optional failure description.
     * @return true when the engine is ready.
     */
    virtual bool initialize(const EngineSettings& settings, QString* errorMessage) = 0;

    /**
     * @brief Checks whether a source can be handled by the engine.
     * @param source Magnet URI or descriptor file path.
     */
    virtual bool validate(const QString& source) = 0;

    /**
     * @brief Starts (or restarts) a transfer session for a record.
     *
     * Data is written below DownloadRecord::stagingPath.
     *
     * @param record Record to start.
     * @param errorMessage Optional failure description.
     * @return true when the session is running.
     */
    virtual bool start(const DownloadRecord& record, QString* errorMessage) = 0;

    /**
     * @brief Suspends a session.
     */
    virtual bool pause(const QString& id, QString* errorMessage) = 0;

    /**
     * @brief Continues a suspended session.
     */
    virtual bool resume(const QString& id, QString* errorMessage) = 0;

    /**
     * @brief Ends a session.
     * @param id Record id.
     * @param deleteFiles Also remove the data written so far.
     * @param errorMessage Optional failure description.
     */
    virtual bool stop(const QString& id, bool deleteFiles, QString* errorMessage) = 0;

    /**
     * @brief Reports live figures.
     * @return std::nullopt when there is no session for @p id.
     */
    virtual std::optional<TransferMetrics> progress(const QString& id) = 0;

    /**
     * @brief Stops every session and releases engine resources.
     */
    virtual void shutdown() = 0;
};

#endif // BARAN_CORE_TRANSFERENGINE_HPP
