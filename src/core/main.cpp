#include "downloadmanager.hpp"
#include "services/jellyfincatalog.hpp"
#include "services/libtorrentengine.hpp"
#include "services/settings.hpp"
#include "services/staticcatalog.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QSocketNotifier>
#include <QTextStream>
#include <QUrl>

#include <csignal>
#include <memory>
#include <sys/socket.h>
#include <unistd.h>

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace {

int signalFds[2] = { -1, -1 };

void onUnixSignal(int)
{
    const char byte = 1;
    const ssize_t written = ::write(signalFds[0], &byte, sizeof(byte));
    static_cast<void>(written);
}

bool installSignalHandlers()
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, signalFds) != 0) return false;

    struct sigaction action {};
    action.sa_handler = onUnixSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &action, nullptr) == 0 && ::sigaction(SIGTERM, &action, nullptr) == 0;
}

void printRecords(const QVector<DownloadRecord>& records)
{
    QTextStream out(stdout);
    for (const DownloadRecord& r : records) {
        out << r.id << '\t' << statusToString(r.status) << '\t'
            << QString::number(r.percent, 'f', 1) << "%\t" << r.owner << '\t' << r.displayName;
        if (r.errorMessage) out << "\t(" << *r.errorMessage << ')';
        out << Qt::endl;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Baran"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Baran download lifecycle daemon"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringList { QStringLiteral("c"), QStringLiteral("config") },
                                          QStringLiteral("Configuration file (INI)."), QStringLiteral("file"));
    const QCommandLineOption addOption(QStringList { QStringLiteral("a"), QStringLiteral("add") },
                                       QStringLiteral("Queue a magnet URI or .torrent file. May be repeated."),
                                       QStringLiteral("source"));
    const QCommandLineOption ownerOption(QStringLiteral("owner"), QStringLiteral("Owner of added downloads."),
                                         QStringLiteral("name"), QStringLiteral("cli"));
    const QCommandLineOption destinationOption(QStringLiteral("destination"),
                                               QStringLiteral("Catalog destination id for added downloads."),
                                               QStringLiteral("id"));
    const QCommandLineOption listOption(QStringLiteral("list"), QStringLiteral("Print downloads and exit."));
    const QCommandLineOption cleanupOption(QStringLiteral("cleanup"), QStringLiteral("Clean staging and exit."));
    parser.addOptions({ configOption, addOption, ownerOption, destinationOption, listOption, cleanupOption });
    parser.process(app);

    DownloaderSettings settings = defaultDownloaderSettings();
    if (parser.isSet(configOption)) {
        QStringList warnings;
        DownloadError error;
        if (!loadDownloaderSettings(parser.value(configOption), &settings, &warnings, &error)) {
            qCritical() << error.message;
            return 2;
        }
        for (const QString& w : std::as_const(warnings)) qWarning() << w;
    } else {
        const QStringList corrections = validateDownloaderSettings(settings);
        for (const QString& w : corrections) qWarning() << w;
    }

    std::unique_ptr<CatalogService> catalog;
    if (!settings.jellyfinUrl.isEmpty()) {
        catalog = std::make_unique<JellyfinCatalog>(QUrl(settings.jellyfinUrl), settings.catalogApiKey,
                                                    settings.catalogRequestTimeout);
    } else {
        catalog = std::make_unique<StaticCatalog>(settings.destinations);
    }
    LibtorrentEngine engine;
    DownloadManager manager(settings, engine, *catalog);

    DownloadError startupError;
    if (!manager.startup(&startupError)) {
        qCritical() << "Startup failed:" << startupError.kindName() << startupError.message;
        return 1;
    }
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &manager, &DownloadManager::shutdown);

    const QStringList sources = parser.values(addOption);
    for (const QString& source : sources) {
        DownloadError error;
        const auto record = manager.createDownload(source, parser.value(ownerOption), parser.value(destinationOption), &error);
        if (!record) {
            qCritical() << "Cannot add" << source << "-" << error.kindName() << error.message;
            continue;
        }
        QTextStream(stdout) << record->id << Qt::endl;
    }

    if (parser.isSet(cleanupOption)) {
        const CleanupResult result = manager.triggerCleanup();
        QTextStream(stdout) << "Removed " << result.removed << " staging director(ies), freed "
                            << result.bytesFreed << " bytes" << Qt::endl;
    }
    if (parser.isSet(listOption)) printRecords(manager.listDownloads());
    if (parser.isSet(listOption) || parser.isSet(cleanupOption)) {
        manager.shutdown();
        return 0;
    }

    if (!installSignalHandlers()) {
        qWarning() << "Cannot install signal handlers; stop with an external kill";
    } else {
        auto* notifier = new QSocketNotifier(signalFds[1], QSocketNotifier::Read, &app);
        QObject::connect(notifier, &QSocketNotifier::activated, &app, [notifier]() {
            notifier->setEnabled(false);
            char byte = 0;
            const ssize_t received = ::read(signalFds[1], &byte, sizeof(byte));
            static_cast<void>(received);
            qInfo() << "Termination requested";
            QCoreApplication::quit();
        });
    }

    return app.exec();
}
