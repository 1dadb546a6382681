#include "core/storagemonitor.hpp"
#include "services/staticcatalog.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

using namespace baran::testing;

namespace {

StorageSettings thresholds()
{
    StorageSettings s;
    s.warningThresholdBytes = 10 * kGiB;
    s.criticalThresholdBytes = 2 * kGiB;
    s.recoveryThresholdBytes = 15 * kGiB;
    return s;
}

class StorageMonitorTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(dir_.isValid()); }

    QString staging() const { return dir_.filePath(QStringLiteral("staging")); }

    QTemporaryDir dir_;
    FakeVolume volume_ { 100 * kGiB };
};

TEST_F(StorageMonitorTest, HealthLevelsFollowThresholds)
{
    StorageMonitor monitor(staging(), thresholds(), nullptr, volume_.probe());

    monitor.checkNow();
    ASSERT_EQ(monitor.volumes().size(), 1);
    EXPECT_EQ(monitor.volumes().first().health, StorageHealth::Normal);
    EXPECT_TRUE(monitor.volumes().first().isStagingVolume);

    volume_.setAvailable(5 * kGiB);
    monitor.checkNow();
    EXPECT_EQ(monitor.volumes().first().health, StorageHealth::Warning);
    EXPECT_FALSE(monitor.isCritical());

    volume_.setAvailable(1 * kGiB);
    monitor.checkNow();
    EXPECT_EQ(monitor.volumes().first().health, StorageHealth::Critical);
    EXPECT_TRUE(monitor.isCritical());
}

TEST_F(StorageMonitorTest, CriticalLatchesUntilRecoveryThreshold)
{
    StorageMonitor monitor(staging(), thresholds(), nullptr, volume_.probe());
    QList<bool> flips;
    monitor.setGateObserver([&flips](bool critical) { flips << critical; });

    volume_.setAvailable(1 * kGiB);
    monitor.checkNow();
    EXPECT_TRUE(monitor.isCritical());

    // Above critical but not above recovery: still latched.
    volume_.setAvailable(12 * kGiB);
    monitor.checkNow();
    EXPECT_TRUE(monitor.isCritical());
    EXPECT_EQ(monitor.volumes().first().health, StorageHealth::Critical);

    volume_.setAvailable(15 * kGiB);
    monitor.checkNow();
    EXPECT_TRUE(monitor.isCritical());

    volume_.setAvailable(15 * kGiB + 1);
    monitor.checkNow();
    EXPECT_FALSE(monitor.isCritical());
    EXPECT_EQ(flips, (QList<bool> { true, false }));
}

TEST_F(StorageMonitorTest, LatchSurvivesAMissedSample)
{
    const QString libraryPath = dir_.filePath(QStringLiteral("library"));
    StaticCatalog catalog({
        { QStringLiteral("lib"), QStringLiteral("Library"), baran::utils::MediaClass::Video, { libraryPath } },
    });
    std::atomic<qint64> libraryAvailable { 1 * kGiB };
    std::atomic<bool> libraryReadable { true };
    VolumeProbe probe = [&](const QString& path) -> std::optional<VolumeSample> {
        if (path == libraryPath) {
            if (!libraryReadable.load()) return std::nullopt;
            return VolumeSample { QStringLiteral("/library"), libraryAvailable.load(), 100 * kGiB };
        }
        return VolumeSample { QStringLiteral("/staging"), 50 * kGiB, 100 * kGiB };
    };
    StorageMonitor monitor(staging(), thresholds(), &catalog, probe);
    QList<bool> flips;
    monitor.setGateObserver([&flips](bool critical) { flips << critical; });

    monitor.checkNow();
    ASSERT_TRUE(monitor.isCritical());

    libraryReadable = false;
    monitor.checkNow();
    EXPECT_TRUE(monitor.isCritical());

    // The library is not listed on this tick.
    libraryReadable = true;
    catalog.setDestinations({});
    monitor.checkNow();
    EXPECT_TRUE(monitor.isCritical());

    catalog.setDestinations({
        { QStringLiteral("lib"), QStringLiteral("Library"), baran::utils::MediaClass::Video, { libraryPath } },
    });
    libraryAvailable = 3 * kGiB;
    monitor.checkNow();
    EXPECT_TRUE(monitor.isCritical());
    ASSERT_EQ(monitor.volumes().size(), 2);
    EXPECT_EQ(monitor.volumes().at(1).health, StorageHealth::Critical);

    libraryAvailable = 20 * kGiB;
    monitor.checkNow();
    EXPECT_FALSE(monitor.isCritical());
    EXPECT_EQ(flips, (QList<bool> { true, false }));
}

TEST_F(StorageMonitorTest, VolumesSharingARootAreReportedOnce)
{
    StaticCatalog catalog({
        { QStringLiteral("movies"), QStringLiteral("Movies"), baran::utils::MediaClass::Video, { dir_.filePath(QStringLiteral("movies")) } },
        { QStringLiteral("music"), QStringLiteral("Music"), baran::utils::MediaClass::Audio, { dir_.filePath(QStringLiteral("music")) } },
    });
    StorageMonitor monitor(staging(), thresholds(), &catalog, volume_.probe());
    monitor.checkNow();
    EXPECT_EQ(monitor.volumes().size(), 1);
}

TEST_F(StorageMonitorTest, AnyCriticalVolumeClosesTheGate)
{
    const QString libraryPath = dir_.filePath(QStringLiteral("library"));
    StaticCatalog catalog({
        { QStringLiteral("lib"), QStringLiteral("Library"), baran::utils::MediaClass::Video, { libraryPath } },
    });
    VolumeProbe probe = [&libraryPath](const QString& path) -> std::optional<VolumeSample> {
        if (path == libraryPath) return VolumeSample { QStringLiteral("/library"), 1 * kGiB, 100 * kGiB };
        return VolumeSample { QStringLiteral("/staging"), 50 * kGiB, 100 * kGiB };
    };
    StorageMonitor monitor(staging(), thresholds(), &catalog, probe);
    monitor.checkNow();

    const QVector<VolumeStatus> volumes = monitor.volumes();
    ASSERT_EQ(volumes.size(), 2);
    EXPECT_TRUE(volumes.at(0).isStagingVolume);
    EXPECT_EQ(volumes.at(0).health, StorageHealth::Normal);
    EXPECT_EQ(volumes.at(1).health, StorageHealth::Critical);
    EXPECT_TRUE(monitor.isCritical());
}

TEST_F(StorageMonitorTest, SufficientSpaceComparesAgainstRequiredBytes)
{
    volume_.setAvailable(3 * kGiB);
    StorageMonitor monitor(staging(), thresholds(), nullptr, volume_.probe());
    QString why;
    EXPECT_TRUE(monitor.hasSufficientSpace(staging(), 2 * kGiB, &why));
    EXPECT_FALSE(monitor.hasSufficientSpace(staging(), 4 * kGiB, &why));
    EXPECT_TRUE(why.contains(QStringLiteral("Insufficient space")));
}

TEST_F(StorageMonitorTest, OrphanCleanupKeepsKnownIds)
{
    ASSERT_TRUE(writeFile(QDir(staging()).filePath(QStringLiteral("known/file.bin")), 10));
    ASSERT_TRUE(writeFile(QDir(staging()).filePath(QStringLiteral("orphan/file.bin")), 25));

    StorageMonitor monitor(staging(), thresholds(), nullptr, volume_.probe());
    const CleanupResult result = monitor.cleanupOrphaned({ QStringLiteral("known") });

    EXPECT_EQ(result.removed, 1);
    EXPECT_EQ(result.bytesFreed, 25);
    EXPECT_TRUE(QDir(QDir(staging()).filePath(QStringLiteral("known"))).exists());
    EXPECT_FALSE(QDir(QDir(staging()).filePath(QStringLiteral("orphan"))).exists());
}

TEST_F(StorageMonitorTest, RetentionCleanupSparesProtectedIds)
{
    ASSERT_TRUE(writeFile(QDir(staging()).filePath(QStringLiteral("old/a.bin"))));
    ASSERT_TRUE(writeFile(QDir(staging()).filePath(QStringLiteral("busy/a.bin"))));

    StorageMonitor monitor(staging(), thresholds(), nullptr, volume_.probe());
    const QDateTime future = QDateTime::currentDateTimeUtc().addDays(1);
    const CleanupResult result = monitor.cleanupOlderThan(future, { QStringLiteral("busy") });

    EXPECT_EQ(result.removed, 1);
    EXPECT_TRUE(QDir(QDir(staging()).filePath(QStringLiteral("busy"))).exists());

    EXPECT_EQ(monitor.cleanupOlderThan(QDateTime::currentDateTimeUtc().addDays(-1)).removed, 0);
}

TEST_F(StorageMonitorTest, SystemProbeWalksUpToAnExistingDirectory)
{
    const auto sample = StorageMonitor::systemProbe(dir_.filePath(QStringLiteral("not/yet/created")));
    ASSERT_TRUE(sample.has_value());
    EXPECT_GT(sample->totalBytes, 0);
    EXPECT_FALSE(sample->rootPath.isEmpty());
}

} // namespace
