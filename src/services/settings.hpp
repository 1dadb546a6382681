/*!
 * @file        settings.hpp
 * @brief       Downloader configuration loaded from an INI file.
 * @details     Collects every tunable of the download core (paths, queue
 *              limits, storage thresholds, import policy, cleanup, engine and
 *              catalog options) in one value type. Values are read with
 *              QSettings in INI format; missing keys keep their defaults and
 *              inconsistent combinations are corrected with a warning.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_SERVICES_SETTINGS_HPP
#define BARAN_SERVICES_SETTINGS_HPP

#include "core/catalog.hpp"
#include "core/downloaderror.hpp"
#include "core/importcoordinator.hpp"
#include "core/storagemonitor.hpp"
#include "core/transferengine.hpp"

#include <QString>
#include <QStringList>
#include <QVector>

#include <chrono>

/**
 * @brief Complete downloader configuration.
 */
struct DownloaderSettings {
    QString stagingDirectory;                                   //!< @brief Root of job staging directories.
    QString stateFile;                                          //!< @brief Snapshot file.

    int maxConcurrentDownloads = 3;                             //!< @brief Largest number of Active records.
    std::chrono::milliseconds passInterval { 30000 };           //!< @brief Safety-net admission pass period.
    std::chrono::milliseconds pollInterval { 2000 };            //!< @brief Progress polling cadence.
    std::chrono::milliseconds engineCallTimeout { 30000 };      //!< @brief Bound on a single engine call.

    StorageSettings storage;                                    //!< @brief Thresholds and check intervals.
    ImportSettings importing;                                   //!< @brief Import policy.

    bool enableAutomaticCleanup = false;                        //!< @brief Periodic retention cleanup.
    int cleanupRetentionDays = 30;                              //!< @brief Age limit for staging directories.
    std::chrono::milliseconds cleanupInterval { 24 * 3600 * 1000 }; //!< @brief Retention cleanup period.

    EngineSettings engine;                                      //!< @brief Transfer engine options.

    QString jellyfinUrl;                                        //!< @brief Media server base URL, empty for the static catalog.
    QString catalogApiKey;                                      //!< @brief Media server API key.
    std::chrono::milliseconds catalogRequestTimeout { 15000 };  //!< @brief Media server request timeout.
    QVector<CatalogDestination> destinations;                   //!< @brief Static catalog destinations.
};

/**
 * @brief Returns the defaults, with paths below the application data location.
 */
DownloaderSettings defaultDownloaderSettings();

/**
 * @brief Reads settings from an INI file on top of the defaults.
 * @param iniPath Configuration file.
 * @param settings Output; untouched on failure.
 * @param warnings Optional output receiving corrections made during validation.
 * @param error Optional failure description.
 * @return false if the file is missing or malformed.
 */
bool loadDownloaderSettings(const QString& iniPath, DownloaderSettings* settings,
                            QStringList* warnings = nullptr, DownloadError* error = nullptr);

/**
 * @brief Corrects inconsistent values in place.
 * @return One message per correction.
 */
QStringList validateDownloaderSettings(DownloaderSettings& settings);

#endif // BARAN_SERVICES_SETTINGS_HPP
