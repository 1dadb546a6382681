#include "utils/category_utils.hpp"
#include "utils/download_utils.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <QTemporaryDir>

using namespace baran::utils;

namespace {

TEST(DownloadUtilsTest, MagnetUriNeedsAnExactTopic)
{
    EXPECT_TRUE(isMagnetUri(QStringLiteral("magnet:?xt=urn:btih:0123456789abcdef&dn=Film")));
    EXPECT_TRUE(isMagnetUri(QStringLiteral("  MAGNET:?dn=x&xt=urn:btmh:1220abcd  ")));
    EXPECT_FALSE(isMagnetUri(QStringLiteral("magnet:?dn=NoTopic")));
    EXPECT_FALSE(isMagnetUri(QStringLiteral("magnet:?xt=urn:")));
    EXPECT_FALSE(isMagnetUri(QStringLiteral("https://example.com/file.torrent")));
    EXPECT_FALSE(isMagnetUri(QString()));
}

TEST(DownloadUtilsTest, TorrentFilePathMustExist)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("album.torrent"));
    EXPECT_FALSE(isTorrentFilePath(path));
    ASSERT_TRUE(baran::testing::writeFile(path));
    EXPECT_TRUE(isTorrentFilePath(path));
    EXPECT_TRUE(isTorrentFilePath(QStringLiteral("file://") + path));
    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("album.txt"))));
    EXPECT_FALSE(isTorrentFilePath(dir.filePath(QStringLiteral("album.txt"))));
}

TEST(DownloadUtilsTest, DisplayNameComesFromMagnetOrFileName)
{
    EXPECT_EQ(displayNameFromSource(QStringLiteral("magnet:?xt=urn:btih:abc&dn=My+Show%3A+S01")), QStringLiteral("My Show_ S01"));
    EXPECT_EQ(displayNameFromSource(QStringLiteral("magnet:?xt=urn:btih:abc")), QStringLiteral("Unknown"));
    EXPECT_EQ(displayNameFromSource(QStringLiteral("/srv/in/Concert.2024.torrent")), QStringLiteral("Concert.2024"));
}

TEST(DownloadUtilsTest, SanitizeStripsReservedAndControlCharacters)
{
    EXPECT_EQ(sanitizeDisplayName(QStringLiteral("a/b\\c?d*e")), QStringLiteral("a_b_c_d_e"));
    EXPECT_EQ(sanitizeDisplayName(QStringLiteral("  name...  ")), QStringLiteral("name"));
    EXPECT_EQ(sanitizeDisplayName(QStringLiteral("tab\there")), QStringLiteral("tabhere"));
    EXPECT_EQ(sanitizeDisplayName(QStringLiteral("..")), QStringLiteral("Unknown"));
    EXPECT_EQ(sanitizeDisplayName(QString(300, QLatin1Char('x'))).size(), 200);
}

TEST(DownloadUtilsTest, UniquePathAppendsTimestampThenCounter)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString base = dir.filePath(QStringLiteral("Movie"));
    const QDateTime now = QDateTime::fromString(QStringLiteral("2026-05-04T03:02:01Z"), Qt::ISODate);

    EXPECT_EQ(timestampedUniquePath(base, now), base);
    ASSERT_TRUE(QDir().mkpath(base));
    EXPECT_EQ(timestampedUniquePath(base, now), base + QStringLiteral("_20260504030201"));
    ASSERT_TRUE(QDir().mkpath(base + QStringLiteral("_20260504030201")));
    EXPECT_EQ(timestampedUniquePath(base, now), base + QStringLiteral("_20260504030201_1"));
}

TEST(DownloadUtilsTest, MoveDirectoryRefusesExistingTarget)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("src/a/b.bin")), 7));
    ASSERT_TRUE(QDir().mkpath(dir.filePath(QStringLiteral("taken"))));

    QString why;
    EXPECT_FALSE(moveDirectory(dir.filePath(QStringLiteral("src")), dir.filePath(QStringLiteral("taken")), nullptr, &why));
    EXPECT_TRUE(why.contains(QStringLiteral("already exists")));

    bool renamed = false;
    ASSERT_TRUE(moveDirectory(dir.filePath(QStringLiteral("src")), dir.filePath(QStringLiteral("out/dst")), &renamed, &why));
    EXPECT_TRUE(renamed);
    EXPECT_EQ(directorySize(dir.filePath(QStringLiteral("out/dst"))), 7);
}

TEST(DownloadUtilsTest, CopyDirectoryKeepsTree)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("src/x.bin")), 3));
    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("src/sub/y.bin")), 5));
    ASSERT_TRUE(copyDirectory(dir.filePath(QStringLiteral("src")), dir.filePath(QStringLiteral("copy"))));
    EXPECT_EQ(directorySize(dir.filePath(QStringLiteral("copy"))), 8);
    EXPECT_EQ(directorySize(dir.filePath(QStringLiteral("src"))), 8);
}

TEST(DownloadUtilsTest, PublishCopyMovesTheTree)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("src/x.bin")), 3));
    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("src/sub/y.bin")), 5));

    QString why;
    ASSERT_TRUE(publishCopy(dir.filePath(QStringLiteral("src")), dir.filePath(QStringLiteral("lib/dst")), &why)) << qPrintable(why);
    EXPECT_EQ(directorySize(dir.filePath(QStringLiteral("lib/dst"))), 8);
    EXPECT_FALSE(QFileInfo::exists(dir.filePath(QStringLiteral("src"))));
    EXPECT_FALSE(QFileInfo::exists(dir.filePath(QStringLiteral("lib/dst.partial"))));
}

TEST(DownloadUtilsTest, PublishCopyKeepsSourceOnFailure)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString why;
    EXPECT_FALSE(publishCopy(dir.filePath(QStringLiteral("missing")), dir.filePath(QStringLiteral("dst")), &why));
    EXPECT_TRUE(why.contains(QStringLiteral("does not exist")));
    EXPECT_FALSE(QFileInfo::exists(dir.filePath(QStringLiteral("dst"))));
    EXPECT_FALSE(QFileInfo::exists(dir.filePath(QStringLiteral("dst.partial"))));
}

TEST(CategoryUtilsTest, ExtensionsMapToClasses)
{
    EXPECT_EQ(detectMediaClass(QStringLiteral("/a/b/Film.MKV")), MediaClass::Video);
    EXPECT_EQ(detectMediaClass(QStringLiteral("song.flac")), MediaClass::Audio);
    EXPECT_EQ(detectMediaClass(QStringLiteral("readme.nfo")), MediaClass::Unknown);
    EXPECT_EQ(detectMediaClass(QStringLiteral("noextension")), MediaClass::Unknown);
}

TEST(CategoryUtilsTest, DirectoryClassIsTheMajority)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("cd1/01.mp3"))));
    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("cd1/02.mp3"))));
    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("video.mp4"))));
    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("cover.jpg"))));
    EXPECT_EQ(classifyDirectory(dir.path()), MediaClass::Audio);

    ASSERT_TRUE(baran::testing::writeFile(dir.filePath(QStringLiteral("extra.mkv"))));
    EXPECT_EQ(classifyDirectory(dir.path()), MediaClass::Unknown);
}

TEST(CategoryUtilsTest, NamesRoundTrip)
{
    for (const MediaClass c : { MediaClass::Video, MediaClass::Audio, MediaClass::Unknown }) {
        EXPECT_EQ(mediaClassFromName(mediaClassName(c)), c);
    }
    EXPECT_EQ(mediaClassFromName(QStringLiteral(" Video ")), MediaClass::Video);
}

} // namespace
