/*!
 * @file        appsettings.cppm
 * @brief       Typed application settings and their compiled-in defaults.
 * @details     Describes the nested settings document (interface flags,
 *              shortcut bindings, engine tunables, session flags) as plain
 *              structs and converts between the structs and the JSON form
 *              stored on disk.
 *
 *              The default document doubles as the schema of the store:
 *              every leaf path of defaultSettingsDocument() is a valid
 *              settings key, and the JSON type of the default is the type
 *              a write must carry.
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
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module tondar.core.appsettings;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

TONDAR_MODULE_EXPORT namespace tondar {

//!< @brief Interface and window behaviour ("app" group).
struct AppConfig {
    bool showTrayIcon = true;
    bool quitOnClose = false;
    QString sidebar = QStringLiteral("left");          //!< "left" or "right".
    QString theme = QStringLiteral("system");          //!< "light", "dark" or "system".
    QString buttonLabel = QStringLiteral("both");      //!< "text", "icon" or "both".
    bool showDownloadProgress = true;
    bool showSegmentProgress = true;
    bool autostart = false;
};

//!< @brief Keyboard bindings ("shortcuts" group).
struct ShortcutConfig {
    QString goHome = QStringLiteral("Ctrl+K");
    QString openSettings = QStringLiteral("Ctrl+P");
    QString addDownload = QStringLiteral("Ctrl+N");
    QString openDetails = QStringLiteral("Ctrl+D");
    QString openHistory = QStringLiteral("Ctrl+H");
    QString toggleSidebar = QStringLiteral("Ctrl+L");
    QString cancelDownload = QStringLiteral("Ctrl+C");
    QString quitApp = QStringLiteral("Ctrl+Q");
};

//!< @brief Engine transfer tunables ("download" group).
struct DownloadConfig {
    QString downloadLocation;
    int numThreads = 8;
    int chunkSize = 16;
    int socketBufferSize = 0;
    qint64 speedLimit = 0;          //!< Bytes per second, 0 = unlimited.
};

//!< @brief Engine connection limits ("thread" group).
struct ThreadConfig {
    int totalConnections = 1;
    int perTaskConnections = 1;
};

//!< @brief Session persistence flags ("session" group).
struct SessionConfig {
    bool history = false;           //!< Keep finished downloads across restarts.
    bool metadata = false;
};

/**
 * @brief The complete settings document in typed form.
 */
struct AppSettings {
    AppConfig app;
    ShortcutConfig shortcuts;
    DownloadConfig download;
    ThreadConfig thread;
    SessionConfig session;
    bool sendAnonymousMetrics = false;
    bool showNotifications = true;

    /**
     * @brief Compiled-in defaults; the download location is the user's
     *        standard downloads folder.
     */
    static AppSettings defaults();

    /**
     * @brief Reads a document; keys that are missing or carry the wrong
     *        JSON type fall back to their defaults.
     */
    static AppSettings fromJson(const QJsonObject& document);

    QJsonObject toJson() const;
};

/**
 * @brief Default settings document; its leaf paths are the valid keys.
 */
QJsonObject defaultSettingsDocument();

/**
 * @brief Largest value a numeric setting accepts.
 *
 * Byte rates are 64-bit; every other numeric setting is an int.
 */
qint64 maxSettingValue(const QString& path);

/**
 * @brief Allowed values of enumerated string settings.
 *
 * @param path Dotted settings path.
 * @return The allowed values, or an empty list when any string is accepted.
 */
QStringList allowedSettingValues(const QString& path);

} // namespace tondar
