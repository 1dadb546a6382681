#include "periodictask.hpp"

#include <QDeadlineTimer>
#include <QDebug>

#include <exception>

PeriodicTask::PeriodicTask(const QString& name, std::chrono::milliseconds interval, std::function<void()> tick)
    : m_name(name)
    , m_tick(std::move(tick))
    , m_interval(interval)
{
}

PeriodicTask::~PeriodicTask()
{
    stop();
}

void PeriodicTask::start(bool runImmediately)
{
    QMutexLocker locker(&m_mutex);
    if (m_thread) return;
    m_stopRequested = false;
    m_triggered = false;
    m_thread.reset(QThread::create([this, runImmediately]() { run(runImmediately); }));
    m_thread->setObjectName(m_name);
    m_thread->start();
}

void PeriodicTask::stop()
{
    std::unique_ptr<QThread> thread;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_thread) return;
        m_stopRequested = true;
        m_wake.wakeAll();
        thread = std::move(m_thread);
    }
    thread->wait();
}

void PeriodicTask::triggerNow()
{
    QMutexLocker locker(&m_mutex);
    m_triggered = true;
    m_wake.wakeAll();
}

void PeriodicTask::setInterval(std::chrono::milliseconds interval)
{
    QMutexLocker locker(&m_mutex);
    if (m_interval == interval) return;
    m_interval = interval;
    m_wake.wakeAll();
}

std::chrono::milliseconds PeriodicTask::interval() const
{
    QMutexLocker locker(&m_mutex);
    return m_interval;
}

bool PeriodicTask::isRunning() const
{
    QMutexLocker locker(&m_mutex);
    return m_thread != nullptr;
}

QString PeriodicTask::name() const
{
    return m_name;
}

void PeriodicTask::run(bool runImmediately)
{
    if (runImmediately) runTick();

    for (;;) {
        {
            QMutexLocker locker(&m_mutex);
            QDeadlineTimer deadline(m_interval);
            while (!m_stopRequested && !m_triggered) {
                if (!m_wake.wait(&m_mutex, deadline)) break;
                // An interval change restarts the wait with the new value.
                deadline = QDeadlineTimer(m_interval);
            }
            if (m_stopRequested) return;
            m_triggered = false;
        }
        runTick();
    }
}

void PeriodicTask::runTick()
{
    if (!m_tick) return;
    try {
        m_tick();
    } catch (const std::exception& e) {
        qCritical() << "Periodic task" << m_name << "tick failed:" << e.what();
    }
}
