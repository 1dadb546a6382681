/*!
 * @file        downloaderror.hpp
 * @brief       Error description returned by download operations.
 * @details     Operations of the download core report failures through an
 *              optional DownloadError out-parameter next to a bool or
 *              std::optional return value, the same way Qt reports JSON parse
 *              failures through QJsonParseError.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

#ifndef BARAN_CORE_DOWNLOADERROR_HPP
#define BARAN_CORE_DOWNLOADERROR_HPP

#include <QString>

/**
 * @brief Kind and message of a failed download operation.
 */
struct DownloadError {

    /**
     * @brief Failure category.
     */
    enum class Kind {
        None,           //!< @brief No error.
        Validation,     //!< @brief Malformed or unrecognised input, rejected before any state change.
        Conflict,       //!< @brief Operation not allowed in the current state.
        NotFound,       //!< @brief Unknown record id.
        Engine,         //!< @brief Transfer engine failure or timeout.
        Import,         //!< @brief Relocation into the catalog failed.
        Persistence     //!< @brief Snapshot could not be written.
    };

    Kind kind = Kind::None;     //!< @brief Failure category.
    QString message;            //!< @brief Human readable description.

    /**
     * @brief Returns a short name for the error kind, used in log output.
     */
    QString kindName() const
    {
        switch (kind) {
        case Kind::None: return QStringLiteral("None");
        case Kind::Validation: return QStringLiteral("ValidationError");
        case Kind::Conflict: return QStringLiteral("ConflictError");
        case Kind::NotFound: return QStringLiteral("NotFoundError");
        case Kind::Engine: return QStringLiteral("EngineError");
        case Kind::Import: return QStringLiteral("ImportError");
        case Kind::Persistence: return QStringLiteral("PersistenceError");
        }
        return QString();
    }
};

/**
 * @brief Fills @p error, if given, and returns false.
 *
 * Keeps the error reporting sites one line long.
 */
inline bool setDownloadError(DownloadError* error, DownloadError::Kind kind, const QString& message)
{
    if (error) {
        error->kind = kind;
        error->message = message;
    }
    return false;
}

#endif // BARAN_CORE_DOWNLOADERROR_HPP
