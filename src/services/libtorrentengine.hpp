/*!
 * @file        libtorrentengine.hpp
 * @brief       Transfer engine backed by libtorrent-rasterbar.
 * @details     One lt::session serves every download. Sessions are keyed by
 *              record id; magnet URIs and .torrent files are both accepted.
 *              Data is saved below each record's staging directory.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_SERVICES_LIBTORRENTENGINE_HPP
#define BARAN_SERVICES_LIBTORRENTENGINE_HPP

#include "core/transferengine.hpp"

#include <QHash>
#include <QMutex>

#include <libtorrent/session.hpp>
#include <libtorrent/torrent_handle.hpp>

#include <memory>

class LibtorrentEngine : public TransferEngine {
public:
    LibtorrentEngine() = default;
    ~LibtorrentEngine() override;

    LibtorrentEngine(const LibtorrentEngine&) = delete;
    LibtorrentEngine& operator=(const LibtorrentEngine&) = delete;

    bool initialize(const EngineSettings& settings, QString* errorMessage) override;
    bool validate(const QString& source) override;
    bool start(const DownloadRecord& record, QString* errorMessage) override;
    bool pause(const QString& id, QString* errorMessage) override;
    bool resume(const QString& id, QString* errorMessage) override;
    bool stop(const QString& id, bool deleteFiles, QString* errorMessage) override;
    std::optional<TransferMetrics> progress(const QString& id) override;
    void shutdown() override;

private:
    std::optional<lt::torrent_handle> handleFor(const QString& id, QString* errorMessage);
    void drainAlerts();

    QMutex m_mutex;                                     //!< @brief Guards the fields below.
    std::unique_ptr<lt::session> m_session;             //!< @brief Shared session, null until initialize().
    QHash<QString, lt::torrent_handle> m_handles;       //!< @brief Sessions by record id.
};

#endif // BARAN_SERVICES_LIBTORRENTENGINE_HPP
