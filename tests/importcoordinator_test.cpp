#include "core/importcoordinator.hpp"
#include "services/staticcatalog.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <QTemporaryDir>
#include <QtConcurrent>

#include <vector>

using namespace baran::testing;
using baran::utils::MediaClass;

namespace {

//! Catalog whose listing can be made to fail a number of times.
class FlakyCatalog : public StaticCatalog {
public:
    using StaticCatalog::StaticCatalog;

    QVector<CatalogDestination> destinations(QString* errorMessage = nullptr) override
    {
        if (failuresLeft > 0) {
            --failuresLeft;
            if (errorMessage) *errorMessage = QStringLiteral("connection refused");
            return {};
        }
        return StaticCatalog::destinations(errorMessage);
    }

    std::atomic<int> failuresLeft { 0 };
};

class ImportCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir_.isValid());
        catalog_.setDestinations({
            { QStringLiteral("movies"), QStringLiteral("Movies"), MediaClass::Video, { path(QStringLiteral("library/movies")) } },
            { QStringLiteral("music"), QStringLiteral("Music"), MediaClass::Audio, { path(QStringLiteral("library/music")) } },
        });
        storage_.checkNow();
    }

    QString path(const QString& relative) const { return dir_.filePath(relative); }

    DownloadRecord completed(const QString& id, const QString& file)
    {
        DownloadRecord r = makeRecord(id, DownloadStatus::Completed, QDateTime::currentDateTimeUtc(), path(QStringLiteral("staging")));
        r.displayName = QStringLiteral("Show %1").arg(id);
        EXPECT_TRUE(writeFile(QDir(r.stagingPath).filePath(file), 64));
        EXPECT_TRUE(store_.insert(r));
        return r;
    }

    ImportSettings settings(int attempts = 3) const
    {
        ImportSettings s;
        s.maxAttempts = attempts;
        s.baseDelay = std::chrono::milliseconds(5000);
        return s;
    }

    QTemporaryDir dir_;
    FakeVolume volume_ { 100 * kGiB };
    RecordStore store_ { dir_.filePath(QStringLiteral("downloads.json")) };
    FlakyCatalog catalog_;
    StorageMonitor storage_ { dir_.filePath(QStringLiteral("staging")), StorageSettings(), &catalog_, volume_.probe() };
};

TEST_F(ImportCoordinatorTest, BackoffDoublesFromTheBaseDelay)
{
    using std::chrono::milliseconds;
    EXPECT_EQ(ImportCoordinator::backoffDelay(milliseconds(5000), 1), milliseconds(5000));
    EXPECT_EQ(ImportCoordinator::backoffDelay(milliseconds(5000), 2), milliseconds(10000));
    EXPECT_EQ(ImportCoordinator::backoffDelay(milliseconds(5000), 3), milliseconds(20000));
}

TEST_F(ImportCoordinatorTest, VideoGoesToTheVideoDestination)
{
    const DownloadRecord r = completed(QStringLiteral("v"), QStringLiteral("episode.mkv"));
    ImportCoordinator importer(store_, storage_, catalog_, settings());

    EXPECT_EQ(importer.importNow(r.id), ImportOutcome::Imported);
    const auto done = store_.get(r.id);
    EXPECT_EQ(done->status, DownloadStatus::Imported);
    EXPECT_TRUE(done->importedAt.isValid());
    EXPECT_TRUE(QFile::exists(path(QStringLiteral("library/movies/Show v/episode.mkv"))));
    EXPECT_EQ(catalog_.rescanCount(), 1);
}

TEST_F(ImportCoordinatorTest, AudioGoesToTheAudioDestination)
{
    const DownloadRecord r = completed(QStringLiteral("a"), QStringLiteral("track.flac"));
    ImportCoordinator importer(store_, storage_, catalog_, settings());
    EXPECT_EQ(importer.importNow(r.id), ImportOutcome::Imported);
    EXPECT_TRUE(QFile::exists(path(QStringLiteral("library/music/Show a/track.flac"))));
}

TEST_F(ImportCoordinatorTest, ExplicitDestinationWins)
{
    DownloadRecord r = completed(QStringLiteral("x"), QStringLiteral("episode.mkv"));
    ASSERT_TRUE(store_.update(r.id, [](DownloadRecord& rec) {
        rec.destinationId = QStringLiteral("music");
        return true;
    }));
    ImportCoordinator importer(store_, storage_, catalog_, settings());
    const auto chosen = importer.selectDestination(*store_.get(r.id), MediaClass::Video);
    ASSERT_TRUE(chosen);
    EXPECT_EQ(chosen->id, QStringLiteral("music"));
}

TEST_F(ImportCoordinatorTest, UnknownContentUsesDefaultThenFirst)
{
    DownloadRecord r = makeRecord(QStringLiteral("u"), DownloadStatus::Completed, QDateTime::currentDateTimeUtc());
    ImportSettings s = settings();
    ImportCoordinator first(store_, storage_, catalog_, s);
    EXPECT_EQ(first.selectDestination(r, MediaClass::Unknown)->id, QStringLiteral("movies"));

    s.defaultDestinationId = QStringLiteral("music");
    ImportCoordinator withDefault(store_, storage_, catalog_, s);
    EXPECT_EQ(withDefault.selectDestination(r, MediaClass::Unknown)->id, QStringLiteral("music"));
}

TEST_F(ImportCoordinatorTest, NameCollisionGetsTimestampSuffix)
{
    ASSERT_TRUE(QDir().mkpath(path(QStringLiteral("library/movies/Show c"))));
    const DownloadRecord r = completed(QStringLiteral("c"), QStringLiteral("film.mp4"));
    ImportCoordinator importer(store_, storage_, catalog_, settings());
    ASSERT_EQ(importer.importNow(r.id), ImportOutcome::Imported);

    const QStringList entries = QDir(path(QStringLiteral("library/movies"))).entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    ASSERT_EQ(entries.size(), 2);
    EXPECT_TRUE(entries.contains(QStringLiteral("Show c")));
    const QString suffixed = entries.at(0) == QStringLiteral("Show c") ? entries.at(1) : entries.at(0);
    EXPECT_TRUE(suffixed.startsWith(QStringLiteral("Show c_")));
    EXPECT_TRUE(QFile::exists(QDir(path(QStringLiteral("library/movies"))).filePath(suffixed + QStringLiteral("/film.mp4"))));
}

TEST_F(ImportCoordinatorTest, TwoFailuresThenSuccessWaitsFiveThenTenSeconds)
{
    const DownloadRecord r = completed(QStringLiteral("r"), QStringLiteral("movie.mkv"));
    catalog_.failuresLeft = 2;

    std::vector<std::chrono::milliseconds> waits;
    ImportCoordinator importer(store_, storage_, catalog_, settings());
    importer.setSleeper([&waits](std::chrono::milliseconds d) {
        waits.push_back(d);
        return true;
    });

    EXPECT_EQ(importer.importNow(r.id), ImportOutcome::Imported);
    ASSERT_EQ(waits.size(), 2u);
    EXPECT_EQ(waits[0], std::chrono::milliseconds(5000));
    EXPECT_EQ(waits[1], std::chrono::milliseconds(10000));
    EXPECT_EQ(store_.get(r.id)->status, DownloadStatus::Imported);
}

TEST_F(ImportCoordinatorTest, ExhaustedAttemptsLeaveRecordCompletedWithDiagnostic)
{
    const DownloadRecord r = completed(QStringLiteral("f"), QStringLiteral("movie.mkv"));
    volume_.setAvailable(10);
    ImportCoordinator importer(store_, storage_, catalog_, settings(2));
    importer.setSleeper([](std::chrono::milliseconds) { return true; });

    EXPECT_EQ(importer.importNow(r.id), ImportOutcome::Failed);
    const auto after = store_.get(r.id);
    EXPECT_EQ(after->status, DownloadStatus::Completed);
    ASSERT_TRUE(after->errorMessage);
    EXPECT_TRUE(after->errorMessage->contains(QStringLiteral("2 attempt(s)")));
    EXPECT_TRUE(after->errorMessage->contains(QStringLiteral("manual import required")));
    EXPECT_TRUE(QDir(r.stagingPath).exists());
}

TEST_F(ImportCoordinatorTest, NoDestinationStopsWithoutRetry)
{
    catalog_.setDestinations({});
    const DownloadRecord r = completed(QStringLiteral("n"), QStringLiteral("movie.mkv"));
    int sleeps = 0;
    ImportCoordinator importer(store_, storage_, catalog_, settings());
    importer.setSleeper([&sleeps](std::chrono::milliseconds) { ++sleeps; return true; });

    EXPECT_EQ(importer.importNow(r.id), ImportOutcome::NoDestination);
    EXPECT_EQ(sleeps, 0);
    EXPECT_EQ(store_.get(r.id)->status, DownloadStatus::Completed);
    EXPECT_TRUE(store_.get(r.id)->errorMessage.has_value());
}

TEST_F(ImportCoordinatorTest, InterruptedBackoffKeepsRecordCompleted)
{
    const DownloadRecord r = completed(QStringLiteral("i"), QStringLiteral("movie.mkv"));
    catalog_.failuresLeft = 5;
    ImportCoordinator importer(store_, storage_, catalog_, settings());
    importer.setSleeper([](std::chrono::milliseconds) { return false; });

    EXPECT_EQ(importer.importNow(r.id), ImportOutcome::Interrupted);
    EXPECT_EQ(store_.get(r.id)->status, DownloadStatus::Completed);
}

TEST_F(ImportCoordinatorTest, AutoImportDisabledSkipsUnlessManual)
{
    const DownloadRecord r = completed(QStringLiteral("m"), QStringLiteral("movie.mkv"));
    ImportSettings s = settings();
    s.autoImport = false;
    ImportCoordinator importer(store_, storage_, catalog_, s);

    EXPECT_EQ(importer.importNow(r.id), ImportOutcome::Skipped);
    EXPECT_EQ(store_.get(r.id)->status, DownloadStatus::Completed);
    EXPECT_EQ(importer.importNow(r.id, true), ImportOutcome::Imported);
}

TEST_F(ImportCoordinatorTest, RemoveAfterImportDeletesStaging)
{
    const DownloadRecord r = completed(QStringLiteral("d"), QStringLiteral("movie.mkv"));
    ImportSettings s = settings();
    s.removeAfterImport = true;
    ImportCoordinator importer(store_, storage_, catalog_, s);
    ASSERT_EQ(importer.importNow(r.id), ImportOutcome::Imported);
    EXPECT_FALSE(QDir(r.stagingPath).exists());
}

TEST_F(ImportCoordinatorTest, QueuedImportsFinishBeforeShutdownReturns)
{
    const DownloadRecord a = completed(QStringLiteral("q1"), QStringLiteral("a.mkv"));
    const DownloadRecord b = completed(QStringLiteral("q2"), QStringLiteral("b.mp3"));
    ImportCoordinator importer(store_, storage_, catalog_, settings());
    EXPECT_TRUE(importer.enqueue(a.id));
    EXPECT_TRUE(importer.enqueue(b.id));
    importer.shutdown();

    EXPECT_EQ(store_.get(a.id)->status, DownloadStatus::Imported);
    EXPECT_EQ(store_.get(b.id)->status, DownloadStatus::Imported);
    EXPECT_FALSE(importer.enqueue(a.id));
}

TEST_F(ImportCoordinatorTest, ImportWaitsForExclusiveStagingWork)
{
    const DownloadRecord r = completed(QStringLiteral("held"), QStringLiteral("episode.mkv"));
    ImportCoordinator importer(store_, storage_, catalog_, settings());

    QFuture<ImportOutcome> pending;
    importer.runExclusive([&]() {
        pending = QtConcurrent::run([&importer, &r]() { return importer.importNow(r.id, true); });
        QThread::msleep(100);
        EXPECT_EQ(store_.get(r.id)->status, DownloadStatus::Completed);
        ASSERT_TRUE(QDir(r.stagingPath).removeRecursively());
    });

    EXPECT_EQ(pending.result(), ImportOutcome::Skipped);
    EXPECT_EQ(store_.get(r.id)->status, DownloadStatus::Completed);
    EXPECT_FALSE(QFileInfo::exists(path(QStringLiteral("library/movies/Show held"))));
}

} // namespace
