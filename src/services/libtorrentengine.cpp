#include "libtorrentengine.hpp"

#include "utils/download_utils.hpp"

#include <QDebug>
#include <QMutexLocker>

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/announce_entry.hpp>
#include <libtorrent/extensions/smart_ban.hpp>
#include <libtorrent/extensions/ut_metadata.hpp>
#include <libtorrent/extensions/ut_pex.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>

#include <algorithm>
#include <climits>
#include <sstream>

namespace utils = baran::utils;

namespace {

QString fromStd(const std::string& value)
{
    return QString::fromStdString(value);
}

void setMessage(QString* errorMessage, const QString& message)
{
    if (errorMessage) *errorMessage = message;
}

} // namespace

LibtorrentEngine::~LibtorrentEngine()
{
    shutdown();
}

bool LibtorrentEngine::initialize(const EngineSettings& settings, QString* errorMessage)
{
    QMutexLocker lock(&m_mutex);
    if (m_session) return true;

    lt::settings_pack pack;
    const std::string port = std::to_string(settings.listenPort);
    pack.set_str(lt::settings_pack::listen_interfaces, "0.0.0.0:" + port + ",[::]:" + port);
    pack.set_str(lt::settings_pack::user_agent, "Baran/1.0 libtorrent/" LIBTORRENT_VERSION);
    pack.set_bool(lt::settings_pack::enable_dht, settings.enableDht);
    pack.set_int(lt::settings_pack::download_rate_limit, static_cast<int>(std::min<qint64>(settings.maxDownloadRate, INT_MAX)));
    pack.set_int(lt::settings_pack::upload_rate_limit, static_cast<int>(std::min<qint64>(settings.maxUploadRate, INT_MAX)));
    const int policy = settings.enableEncryption ? lt::settings_pack::pe_enabled : lt::settings_pack::pe_disabled;
    pack.set_int(lt::settings_pack::out_enc_policy, policy);
    pack.set_int(lt::settings_pack::in_enc_policy, policy);
    pack.set_int(lt::settings_pack::alert_mask, lt::alert_category::error | lt::alert_category::status);

    try {
        lt::session_params params(std::move(pack), {});
        m_session = std::make_unique<lt::session>(std::move(params));
        m_session->add_extension(&lt::create_ut_metadata_plugin);
        if (settings.enablePex) m_session->add_extension(&lt::create_ut_pex_plugin);
        m_session->add_extension(&lt::create_smart_ban_plugin);
    } catch (const std::exception& e) {
        m_session.reset();
        setMessage(errorMessage, QStringLiteral("Cannot create torrent session: %1").arg(QString::fromLocal8Bit(e.what())));
        return false;
    }

    qInfo() << "Torrent session listening on port" << settings.listenPort
            << "DHT" << settings.enableDht << "PEX" << settings.enablePex
            << "encryption" << settings.enableEncryption;
    return true;
}

bool LibtorrentEngine::validate(const QString& source)
{
    const QString trimmed = source.trimmed();
    if (utils::isMagnetUri(trimmed)) {
        lt::error_code ec;
        const lt::add_torrent_params params = lt::parse_magnet_uri(trimmed.toStdString(), ec);
        return !ec;
    }
    if (!utils::isTorrentFilePath(trimmed)) return false;

    lt::error_code ec;
    const lt::torrent_info info(trimmed.toStdString(), ec);
    return !ec;
}

bool LibtorrentEngine::start(const DownloadRecord& record, QString* errorMessage)
{
    lt::add_torrent_params params;
    lt::error_code ec;
    if (utils::isMagnetUri(record.source)) {
        params = lt::parse_magnet_uri(record.source.toStdString(), ec);
        if (ec) {
            setMessage(errorMessage, QStringLiteral("Invalid magnet URI: %1").arg(fromStd(ec.message())));
            return false;
        }
    } else {
        auto info = std::make_shared<lt::torrent_info>(record.source.toStdString(), ec);
        if (ec) {
            setMessage(errorMessage, QStringLiteral("Cannot read %1: %2").arg(record.source, fromStd(ec.message())));
            return false;
        }
        params.ti = std::move(info);
    }
    params.save_path = record.stagingPath.toStdString();

    QMutexLocker lock(&m_mutex);
    if (!m_session) {
        setMessage(errorMessage, QStringLiteral("Torrent session is not initialized"));
        return false;
    }
    if (const auto existing = m_handles.constFind(record.id); existing != m_handles.constEnd() && existing->is_valid()) {
        existing->resume();
        return true;
    }

    const lt::torrent_handle handle = m_session->add_torrent(std::move(params), ec);
    if (ec) {
        setMessage(errorMessage, QStringLiteral("Cannot add torrent: %1").arg(fromStd(ec.message())));
        return false;
    }
    m_handles.insert(record.id, handle);
    qDebug() << "Torrent session started for" << record.id << "in" << record.stagingPath;
    return true;
}

bool LibtorrentEngine::pause(const QString& id, QString* errorMessage)
{
    const auto handle = handleFor(id, errorMessage);
    if (!handle) return false;
    handle->unset_flags(lt::torrent_flags::auto_managed);
    handle->pause(lt::torrent_handle::graceful_pause);
    return true;
}

bool LibtorrentEngine::resume(const QString& id, QString* errorMessage)
{
    const auto handle = handleFor(id, errorMessage);
    if (!handle) return false;
    handle->resume();
    return true;
}

bool LibtorrentEngine::stop(const QString& id, bool deleteFiles, QString* errorMessage)
{
    QMutexLocker lock(&m_mutex);
    if (!m_session) {
        setMessage(errorMessage, QStringLiteral("Torrent session is not initialized"));
        return false;
    }
    const auto it = m_handles.find(id);
    if (it == m_handles.end()) return true;

    const lt::torrent_handle handle = it.value();
    m_handles.erase(it);
    if (handle.is_valid()) {
        m_session->remove_torrent(handle, deleteFiles ? lt::session_handle::delete_files : lt::remove_flags_t{});
    }
    return true;
}

std::optional<TransferMetrics> LibtorrentEngine::progress(const QString& id)
{
    drainAlerts();
    const auto handle = handleFor(id, nullptr);
    if (!handle) return std::nullopt;

    const lt::torrent_status status = handle->status();
    TransferMetrics metrics;
    metrics.totalSize = status.total_wanted;
    metrics.transferredSize = status.total_wanted_done;
    metrics.percent = status.progress * 100.0;
    if (status.is_finished || status.is_seeding) metrics.percent = 100.0;
    metrics.downloadRate = status.download_payload_rate;
    metrics.uploadRate = status.upload_payload_rate;
    metrics.peerCount = status.num_peers;

    if (status.has_metadata) {
        std::ostringstream hash;
        hash << status.info_hashes.get_best();
        metrics.infoHash = fromStd(hash.str());
    }
    const std::vector<lt::announce_entry> trackers = handle->trackers();
    for (const lt::announce_entry& tracker : trackers) {
        metrics.trackers.append(fromStd(tracker.url));
    }
    return metrics;
}

void LibtorrentEngine::shutdown()
{
    std::unique_ptr<lt::session> session;
    {
        QMutexLocker lock(&m_mutex);
        if (!m_session) return;
        session = std::move(m_session);
        m_handles.clear();
    }
    // The proxy destructor blocks until the session has finished tearing down.
    lt::session_proxy proxy = session->abort();
    session.reset();
    qInfo() << "Torrent session closed";
}

std::optional<lt::torrent_handle> LibtorrentEngine::handleFor(const QString& id, QString* errorMessage)
{
    QMutexLocker lock(&m_mutex);
    const auto it = m_handles.constFind(id);
    if (it == m_handles.constEnd() || !it->is_valid()) {
        setMessage(errorMessage, QStringLiteral("No torrent session for %1").arg(id));
        return std::nullopt;
    }
    return it.value();
}

void LibtorrentEngine::drainAlerts()
{
    QMutexLocker lock(&m_mutex);
    if (!m_session) return;

    // Alert pointers stay valid until the next pop_alerts() call.
    std::vector<lt::alert*> alerts;
    m_session->pop_alerts(&alerts);
    for (const lt::alert* alert : alerts) {
        if (const auto* error = lt::alert_cast<lt::torrent_error_alert>(alert)) {
            qWarning() << "Torrent error:" << fromStd(error->message());
        } else if (const auto* listen = lt::alert_cast<lt::listen_failed_alert>(alert)) {
            qWarning() << "Listen failed:" << fromStd(listen->message());
        }
    }
}
