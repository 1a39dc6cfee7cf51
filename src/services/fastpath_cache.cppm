/*!
 * @file        fastpath_cache.cppm
 * @brief       Synchronous cache of display-critical settings.
 * @details     The authoritative settings document is loaded asynchronously.
 *              Until it arrives, the first frames are painted from a tiny
 *              QSettings mirror of the values that change how the window
 *              looks (theme and sidebar position). The mirror is advisory:
 *              whatever the real load returns supersedes it.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module tondar.services.fastpath_cache;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

/**
 * @brief QSettings-backed mirror of the display-affecting settings.
 */
TONDAR_MODULE_EXPORT class FastPathCache {
public:
    /**
     * @brief Constructs a cache.
     *
     * @param iniPath INI file to use; empty selects the application's
     *                native QSettings location.
     */
    explicit FastPathCache(const QString& iniPath = QString());

    /**
     * @brief Dotted paths mirrored by the cache.
     */
    static QStringList mirroredPaths();

    /**
     * @brief Returns the cached values as a partial settings document.
     *
     * Values that are not valid for their setting are skipped.
     */
    QJsonObject read() const;

    /**
     * @brief Mirrors the display-affecting values of @p document.
     */
    void write(const QJsonObject& document);

private:
    QString m_iniPath;
};
