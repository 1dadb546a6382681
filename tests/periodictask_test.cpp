#include "services/periodictask.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

using baran::testing::waitUntil;

namespace {

TEST(PeriodicTaskTest, RunsImmediatelyThenOnInterval)
{
    std::atomic<int> ticks { 0 };
    PeriodicTask task(QStringLiteral("ticker"), std::chrono::milliseconds(20), [&ticks]() { ++ticks; });
    task.start();
    EXPECT_TRUE(task.isRunning());
    EXPECT_TRUE(waitUntil([&ticks]() { return ticks.load() >= 3; }));
    task.stop();
    EXPECT_FALSE(task.isRunning());

    const int afterStop = ticks.load();
    QThread::msleep(60);
    EXPECT_EQ(ticks.load(), afterStop);
}

TEST(PeriodicTaskTest, TriggerWakesALongWait)
{
    std::atomic<int> ticks { 0 };
    PeriodicTask task(QStringLiteral("slow"), std::chrono::hours(1), [&ticks]() { ++ticks; });
    task.start(false);
    QThread::msleep(20);
    EXPECT_EQ(ticks.load(), 0);
    task.triggerNow();
    EXPECT_TRUE(waitUntil([&ticks]() { return ticks.load() == 1; }));
}

TEST(PeriodicTaskTest, ShorterIntervalTakesEffectWithoutRestart)
{
    std::atomic<int> ticks { 0 };
    PeriodicTask task(QStringLiteral("retune"), std::chrono::hours(1), [&ticks]() { ++ticks; });
    task.start(false);
    task.setInterval(std::chrono::milliseconds(10));
    EXPECT_EQ(task.interval(), std::chrono::milliseconds(10));
    EXPECT_TRUE(waitUntil([&ticks]() { return ticks.load() >= 2; }));
}

TEST(PeriodicTaskTest, FailingTickKeepsTheLoopAlive)
{
    std::atomic<int> ticks { 0 };
    PeriodicTask task(QStringLiteral("thrower"), std::chrono::milliseconds(10), [&ticks]() {
        ++ticks;
        throw std::runtime_error("boom");
    });
    task.start();
    EXPECT_TRUE(waitUntil([&ticks]() { return ticks.load() >= 2; }));
}

TEST(PeriodicTaskTest, StopIsIdempotent)
{
    PeriodicTask task(QStringLiteral("idle"), std::chrono::seconds(1), []() {});
    task.stop();
    task.start(false);
    task.stop();
    task.stop();
    EXPECT_FALSE(task.isRunning());
}

} // namespace
