#include "core/guardedengine.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace baran::testing;
using ::testing::_;
using ::testing::Return;

namespace {

TEST(GuardedEngineTest, SlowCallIsReportedAsTimeout)
{
    FakeEngine slow;
    slow.startDelay = std::chrono::milliseconds(400);
    GuardedEngine guard(slow, std::chrono::milliseconds(50));

    DownloadRecord record;
    record.id = QStringLiteral("slow");
    QString why;
    EXPECT_FALSE(guard.start(record, &why));
    EXPECT_TRUE(why.contains(QStringLiteral("timed out")));
}

TEST(GuardedEngineTest, SessionStartedAfterTimeoutIsStopped)
{
    FakeEngine slow;
    slow.startDelay = std::chrono::milliseconds(200);
    GuardedEngine guard(slow, std::chrono::milliseconds(20));

    DownloadRecord record;
    record.id = QStringLiteral("late");
    EXPECT_FALSE(guard.start(record, nullptr));

    ASSERT_TRUE(waitUntil([&]() { return slow.wasStopped(QStringLiteral("late")); }));
    EXPECT_EQ(slow.startCalls(QStringLiteral("late")), 1);
    EXPECT_FALSE(slow.hasSession(QStringLiteral("late")));
}

TEST(GuardedEngineTest, FailedLateStartIsLeftAlone)
{
    FakeEngine slow;
    slow.startDelay = std::chrono::milliseconds(100);
    slow.failStart(QStringLiteral("late"));
    {
        GuardedEngine guard(slow, std::chrono::milliseconds(20));
        DownloadRecord record;
        record.id = QStringLiteral("late");
        EXPECT_FALSE(guard.start(record, nullptr));
    }
    EXPECT_EQ(slow.startCalls(QStringLiteral("late")), 1);
    EXPECT_FALSE(slow.wasStopped(QStringLiteral("late")));
}

TEST(GuardedEngineTest, ForwardsResultsAndErrors)
{
    MockTransferEngine inner;
    EXPECT_CALL(inner, pause(QStringLiteral("a"), _)).WillOnce(::testing::Invoke([](const QString&, QString* why) {
        *why = QStringLiteral("not running");
        return false;
    }));
    EXPECT_CALL(inner, validate(QStringLiteral("magnet:?xt=urn:btih:a"))).WillOnce(Return(true));
    TransferMetrics m;
    m.percent = 42.0;
    EXPECT_CALL(inner, progress(QStringLiteral("a"))).WillOnce(Return(m));

    GuardedEngine guard(inner, std::chrono::seconds(5));
    QString why;
    EXPECT_FALSE(guard.pause(QStringLiteral("a"), &why));
    EXPECT_EQ(why, QStringLiteral("not running"));
    EXPECT_TRUE(guard.validate(QStringLiteral("magnet:?xt=urn:btih:a")));
    const auto progress = guard.progress(QStringLiteral("a"));
    ASSERT_TRUE(progress);
    EXPECT_DOUBLE_EQ(progress->percent, 42.0);
}

TEST(GuardedEngineTest, MissingSessionStaysEmpty)
{
    FakeEngine engine;
    GuardedEngine guard(engine, std::chrono::seconds(5));
    EXPECT_FALSE(guard.progress(QStringLiteral("none")).has_value());
}

} // namespace
