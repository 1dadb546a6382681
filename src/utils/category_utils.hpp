/*!
 * @file        category_utils.hpp
 * @brief       Media classification helpers.
 * @details     Maps file extensions to coarse media classes and classifies a
 *              staged download directory by counting the video and audio files
 *              it contains. The result drives catalog destination selection
 *              during import.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_UTILS_CATEGORY_UTILS_HPP
#define BARAN_UTILS_CATEGORY_UTILS_HPP

#include <QString>
#include <QStringList>

namespace baran::utils {

/**
 * @brief Coarse media class of a file or a directory tree.
 */
enum class MediaClass {
    Unknown,    //!< @brief Nothing recognised, or a tie between video and audio.
    Video,      //!< @brief Movies, shows and other video content.
    Audio       //!< @brief Music and other audio content.
};

/**
 * @brief Detects the media class of a single file based on its extension.
 * @param filePath File name or full path.
 * @return Video, Audio or Unknown.
 */
MediaClass detectMediaClass(const QString& filePath);

/**
 * @brief Classifies a directory by scanning all files below it.
 *
 * Video wins when there are more video files than audio files, audio wins
 * when there are more audio files than video files. A tie (including no
 * media at all) yields Unknown.
 *
 * @param dirPath Directory to scan recursively.
 * @return Majority media class.
 */
MediaClass classifyDirectory(const QString& dirPath);

/**
 * @brief Returns the canonical lowercase name of a media class.
 */
QString mediaClassName(MediaClass mediaClass);

/**
 * @brief Parses a media class name (case-insensitive).
 * @return Unknown for unrecognised input.
 */
MediaClass mediaClassFromName(const QString& name);

/**
 * @brief Known video file extensions, lowercase, without the dot.
 */
QStringList videoExtensions();

/**
 * @brief Known audio file extensions, lowercase, without the dot.
 */
QStringList audioExtensions();

} // namespace baran::utils

#endif // BARAN_UTILS_CATEGORY_UTILS_HPP
