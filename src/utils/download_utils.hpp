/*!
 * @file        download_utils.hpp
 * @brief       Common utility helpers for download sources and staging paths.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across the download core components. These utilities handle
 *              common tasks such as path normalization, source recognition,
 *              display name derivation and directory relocation.
 *
 *              Apart from the directory helpers at the end of this file, all
 *              helpers are side-effect free.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_UTILS_DOWNLOAD_UTILS_HPP
#define BARAN_UTILS_DOWNLOAD_UTILS_HPP

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace baran::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and ensures a consistent representation
 * suitable for filesystem operations.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Decodes a URL query string value.
 *
 * Handles standard percent-decoding and converts '+' characters into spaces,
 * as commonly used in application/x-www-form-urlencoded data.
 *
 * @param value Encoded query value.
 * @return Decoded string.
 */
QString decodeQueryValue(const QString& value);

/**
 * @brief Checks whether a source string is a magnet URI carrying an exact topic.
 * @param source Raw source string.
 * @return true for `magnet:?xt=urn:...` style URIs.
 */
bool isMagnetUri(const QString& source);

/**
 * @brief Checks whether a source string names an existing `.torrent` file.
 * @param source Local path or file URL.
 */
bool isTorrentFilePath(const QString& source);

/**
 * @brief Makes a name safe for use as a single path component.
 *
 * Control characters are dropped, reserved characters are replaced with '_',
 * surrounding whitespace and trailing dots are removed and the result is
 * capped at 200 characters. An empty result becomes "Unknown".
 *
 * @param name Raw name.
 * @return Sanitized name.
 */
QString sanitizeDisplayName(const QString& name);

/**
 * @brief Derives a human readable name from a download source.
 *
 * Uses the `dn` parameter of a magnet URI, or the base name of a descriptor
 * file. The result is sanitized with sanitizeDisplayName().
 *
 * @param source Magnet URI or descriptor file path.
 * @return Display name.
 */
QString displayNameFromSource(const QString& source);

/**
 * @brief Sums the sizes of all regular files below a directory.
 * @param dirPath Directory path.
 * @return Total size in bytes, 0 if the directory does not exist.
 */
qint64 directorySize(const QString& dirPath);

/**
 * @brief Returns a path that does not exist yet.
 *
 * If @p path is free it is returned unchanged. Otherwise a `_yyyyMMddHHmmss`
 * suffix derived from @p now is appended, followed by a counter if that name
 * is taken too.
 *
 * @param path Preferred path.
 * @param now Timestamp used for the suffix (UTC).
 * @return Free path.
 */
QString timestampedUniquePath(const QString& path, const QDateTime& now);

/**
 * @brief Recursively copies a directory tree.
 * @param from Source directory.
 * @param to Target directory, created if missing.
 * @param errorMessage Optional output for a failure description.
 * @return true on success.
 */
bool copyDirectory(const QString& from, const QString& to, QString* errorMessage = nullptr);

/**
 * @brief Relocates a directory.
 *
 * A rename is attempted first. When that fails (typically a cross-volume
 * move) the tree is copied into `<to>.partial` and published with a rename,
 * so @p to only ever appears complete (see publishCopy()).
 *
 * @param from Source directory.
 * @param to Target directory, must not exist.
 * @param renamed Optional output, true if the move was a plain rename.
 * @param errorMessage Optional output for a failure description.
 * @return true on success.
 */
bool moveDirectory(const QString& from, const QString& to, bool* renamed = nullptr, QString* errorMessage = nullptr);

/**
 * @brief Copies @p from into `<to>.partial`, renames it to @p to, then removes @p from.
 *
 * A source that cannot be removed afterwards is logged; the call still succeeds.
 * @return true once @p to is published.
 */
bool publishCopy(const QString& from, const QString& to, QString* errorMessage = nullptr);

} // namespace baran::utils

#endif // BARAN_UTILS_DOWNLOAD_UTILS_HPP
