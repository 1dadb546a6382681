/*!
 * @file        guardedengine.hpp
 * @brief       Timeout decorator around a TransferEngine.
 * @details     Every call is executed on a private thread pool and the caller
 *              waits at most the configured timeout. A call that does not
 *              return in time is reported as failed with a "timed out"
 *              message; its worker keeps running and its late result is
 *              discarded.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_GUARDEDENGINE_HPP
#define BARAN_CORE_GUARDEDENGINE_HPP

#include "transferengine.hpp"

#include <QThreadPool>

#include <chrono>
#include <functional>

/**
 * @brief TransferEngine that bounds the wait on an inner engine.
 */
class GuardedEngine : public TransferEngine {
public:
    /**
     * @brief Wraps @p inner, which must outlive this object.
     * @param inner Engine doing the work.
     * @param timeout Longest time a caller waits for one call.
     */
    GuardedEngine(TransferEngine& inner, std::chrono::milliseconds timeout);

    /**
     * @brief Waits for calls still running on the pool.
     */
    ~GuardedEngine() override;

    bool initialize(const EngineSettings& settings, QString* errorMessage) override;
    bool validate(const QString& source) override;
    bool start(const DownloadRecord& record, QString* errorMessage) override;
    bool pause(const QString& id, QString* errorMessage) override;
    bool resume(const QString& id, QString* errorMessage) override;
    bool stop(const QString& id, bool deleteFiles, QString* errorMessage) override;
    std::optional<TransferMetrics> progress(const QString& id) override;
    void shutdown() override;

    /**
     * @brief Configured timeout.
     */
    std::chrono::milliseconds timeout() const { return m_timeout; }

private:
    /**
     * @brief Runs @p fn on the pool and waits at most the configured timeout.
     * @param lateResult Called on the worker with the result of a call that finished after the caller gave up.
     */
    template <typename T>
    std::optional<T> guarded(const QString& operation, std::function<T(QString*)> fn, QString* errorMessage,
                             std::function<void(const T&)> lateResult = nullptr);

    TransferEngine& m_inner;                //!< @brief Wrapped engine.
    std::chrono::milliseconds m_timeout;    //!< @brief Caller wait bound.
    QThreadPool m_pool;                     //!< @brief Workers executing engine calls.
};

#endif // BARAN_CORE_GUARDEDENGINE_HPP
