/*!
 * @file        periodictask.hpp
 * @brief       Cancellable periodic background loop.
 * @details     Runs a callback on a dedicated thread at a configurable
 *              interval. The loop can be woken early with triggerNow(), its
 *              interval can be changed while it runs, and stop() wakes and
 *              joins the thread deterministically.
 *
 *              Used for progress polling, storage checks, admission passes and
 *              staging cleanup.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_SERVICES_PERIODICTASK_HPP
#define BARAN_SERVICES_PERIODICTASK_HPP

#include <QMutex>
#include <QString>
#include <QThread>
#include <QWaitCondition>

#include <chrono>
#include <functional>
#include <memory>

/**
 * @brief Background loop invoking a tick callback periodically.
 */
class PeriodicTask {
public:
    /**
     * @brief Creates a stopped task.
     * @param name Name used for the thread and in log output.
     * @param interval Delay between the end of one tick and the next one.
     * @param tick Callback run on the task thread.
     */
    PeriodicTask(const QString& name, std::chrono::milliseconds interval, std::function<void()> tick);

    /**
     * @brief Stops and joins the loop.
     */
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Starts the loop thread. Does nothing if already running.
     * @param runImmediately Run the first tick right away instead of after one interval.
     */
    void start(bool runImmediately = true);

    /**
     * @brief Requests the loop to exit and waits for the thread to finish.
     *
     * A tick in progress is allowed to complete. Safe to call repeatedly.
     */
    void stop();

    /**
     * @brief Wakes the loop for an extra tick. Multiple requests coalesce.
     */
    void triggerNow();

    /**
     * @brief Changes the interval; takes effect for the next wait.
     */
    void setInterval(std::chrono::milliseconds interval);

    /**
     * @brief Current interval.
     */
    std::chrono::milliseconds interval() const;

    /**
     * @brief Whether the loop thread is running.
     */
    bool isRunning() const;

    /**
     * @brief Task name.
     */
    QString name() const;

private:
    void run(bool runImmediately);
    void runTick();

    QString m_name;                                 //!< @brief Name used for logging.
    std::function<void()> m_tick;                   //!< @brief Tick callback.
    mutable QMutex m_mutex;                         //!< @brief Guards the fields below.
    QWaitCondition m_wake;                          //!< @brief Signalled on stop, trigger and interval change.
    std::chrono::milliseconds m_interval;           //!< @brief Current interval.
    bool m_stopRequested = false;                   //!< @brief Set by stop().
    bool m_triggered = false;                       //!< @brief Set by triggerNow().
    std::unique_ptr<QThread> m_thread;              //!< @brief Loop thread.
};

#endif // BARAN_SERVICES_PERIODICTASK_HPP
