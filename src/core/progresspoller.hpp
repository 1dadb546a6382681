/*!
 * @file        progresspoller.hpp
 * @brief       Periodic refresh of live transfer figures.
 * @details     On a fixed cadence the poller asks the engine for the metrics
 *              of every Active record and copies them into the record store.
 *              A record reaching 100% becomes Completed and is handed to the
 *              completion handler after the snapshot was written.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_PROGRESSPOLLER_HPP
#define BARAN_CORE_PROGRESSPOLLER_HPP

#include "recordstore.hpp"
#include "transferengine.hpp"
#include "services/periodictask.hpp"

#include <QMutex>

#include <chrono>
#include <functional>

/**
 * @brief Copies engine metrics into Active records.
 */
class ProgressPoller {
public:
    /**
     * @brief Invoked once per record that reached completion.
     */
    using CompletionHandler = std::function<void(const DownloadRecord&)>;

    /**
     * @brief Creates a stopped poller.
     * @param store Record collection.
     * @param engine Transfer engine.
     * @param interval Polling cadence.
     */
    ProgressPoller(RecordStore& store, TransferEngine& engine,
                   std::chrono::milliseconds interval = std::chrono::seconds(2));

    ~ProgressPoller();

    /**
     * @brief Installs the completion handler.
     */
    void setCompletionHandler(CompletionHandler handler);

    /**
     * @brief Starts polling on a background thread.
     */
    void start();

    /**
     * @brief Stops polling and joins the thread.
     */
    void stop();

    /**
     * @brief Runs one polling round on the calling thread.
     * @return Number of records updated.
     */
    int pollOnce();

    /**
     * @brief Estimated seconds remaining, std::nullopt when the rate is not positive.
     */
    static std::optional<qint64> estimateSeconds(qint64 totalSize, qint64 transferredSize, qint64 downloadRate);

private:
    RecordStore& m_store;                   //!< @brief Record collection.
    TransferEngine& m_engine;               //!< @brief Transfer engine.
    QMutex m_handlerMutex;                  //!< @brief Guards m_completionHandler.
    CompletionHandler m_completionHandler;  //!< @brief Completion callback.
    PeriodicTask m_task;                    //!< @brief Poll loop.
};

#endif // BARAN_CORE_PROGRESSPOLLER_HPP
