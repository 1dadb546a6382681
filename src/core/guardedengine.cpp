#include "guardedengine.hpp"

#include <QDebug>
#include <QMutex>
#include <QSemaphore>

#include <memory>

namespace {

template <typename T>
struct CallState {
    QSemaphore done;
    QMutex mutex;
    T value{};
    QString error;
    bool finished = false;
    bool abandoned = false;
    std::function<void(const T&)> lateResult;
};

} // namespace

GuardedEngine::GuardedEngine(TransferEngine& inner, std::chrono::milliseconds timeout)
    : m_inner(inner)
    , m_timeout(timeout)
{
    m_pool.setMaxThreadCount(8);
    m_pool.setObjectName(QStringLiteral("engine-calls"));
}

GuardedEngine::~GuardedEngine()
{
    m_pool.waitForDone();
}

template <typename T>
std::optional<T> GuardedEngine::guarded(const QString& operation, std::function<T(QString*)> fn, QString* errorMessage,
                                        std::function<void(const T&)> lateResult)
{
    auto state = std::make_shared<CallState<T>>();
    m_pool.start([state, fn]() {
        QString error;
        const T value = fn(&error);
        std::function<void(const T&)> late;
        {
            QMutexLocker locker(&state->mutex);
            state->value = value;
            state->error = error;
            state->finished = true;
            if (state->abandoned) late = state->lateResult;
        }
        state->done.release();
        if (late) late(value);
    });

    if (!state->done.tryAcquire(1, static_cast<int>(m_timeout.count()))) {
        QMutexLocker locker(&state->mutex);
        if (!state->finished) {
            state->abandoned = true;
            state->lateResult = std::move(lateResult);
            const QString message = QStringLiteral("Engine call '%1' timed out after %2 ms").arg(operation).arg(m_timeout.count());
            qWarning() << message;
            if (errorMessage) *errorMessage = message;
            return std::nullopt;
        }
    }
    QMutexLocker locker(&state->mutex);
    if (errorMessage) *errorMessage = state->error;
    return state->value;
}

bool GuardedEngine::initialize(const EngineSettings& settings, QString* errorMessage)
{
    const auto ok = guarded<bool>(QStringLiteral("initialize"),
                                  [this, settings](QString* err) { return m_inner.initialize(settings, err); },
                                  errorMessage);
    return ok.value_or(false);
}

bool GuardedEngine::validate(const QString& source)
{
    const auto ok = guarded<bool>(QStringLiteral("validate"),
                                  [this, source](QString*) { return m_inner.validate(source); },
                                  nullptr);
    return ok.value_or(false);
}

bool GuardedEngine::start(const DownloadRecord& record, QString* errorMessage)
{
    const QString id = record.id;
    const auto ok = guarded<bool>(QStringLiteral("start"),
                                  [this, record](QString* err) { return m_inner.start(record, err); },
                                  errorMessage,
                                  [this, id](const bool& started) {
                                      if (!started) return;
                                      // The caller already reported this start as failed.
                                      qWarning() << "Stopping session" << id << "started after its call timed out";
                                      QString stopError;
                                      if (!m_inner.stop(id, true, &stopError)) {
                                          qWarning() << "Failed to stop late session" << id << ":" << stopError;
                                      }
                                  });
    return ok.value_or(false);
}

bool GuardedEngine::pause(const QString& id, QString* errorMessage)
{
    const auto ok = guarded<bool>(QStringLiteral("pause"),
                                  [this, id](QString* err) { return m_inner.pause(id, err); },
                                  errorMessage);
    return ok.value_or(false);
}

bool GuardedEngine::resume(const QString& id, QString* errorMessage)
{
    const auto ok = guarded<bool>(QStringLiteral("resume"),
                                  [this, id](QString* err) { return m_inner.resume(id, err); },
                                  errorMessage);
    return ok.value_or(false);
}

bool GuardedEngine::stop(const QString& id, bool deleteFiles, QString* errorMessage)
{
    const auto ok = guarded<bool>(QStringLiteral("stop"),
                                  [this, id, deleteFiles](QString* err) { return m_inner.stop(id, deleteFiles, err); },
                                  errorMessage);
    return ok.value_or(false);
}

std::optional<TransferMetrics> GuardedEngine::progress(const QString& id)
{
    using Result = std::optional<TransferMetrics>;
    const auto metrics = guarded<Result>(QStringLiteral("progress"),
                                         [this, id](QString*) { return m_inner.progress(id); },
                                         nullptr);
    if (!metrics) return std::nullopt;
    return *metrics;
}

void GuardedEngine::shutdown()
{
    m_inner.shutdown();
    if (!m_pool.waitForDone(static_cast<int>(m_timeout.count()))) {
        qWarning() << "Engine calls still running after shutdown";
    }
}
