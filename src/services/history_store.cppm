/*!
 * @file        history_store.cppm
 * @brief       Persistence of finished downloads across sessions.
 * @details     When the "session.history" setting is on, completed and
 *              failed rows of the registry are written to a JSON file and
 *              loaded back into the registry at the next start. Writes are
 *              debounced so a burst of registry changes produces one save,
 *              and a pending save is flushed when the application quits.
 *
 *              When the setting is off nothing is read or written.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QTimer>
#include <QVector>

#ifndef Q_MOC_RUN
export module tondar.services.history_store;
export import tondar.core.downloadregistry;
export import tondar.core.settingsstore;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

/**
 * @brief Saves terminal registry rows to disk and restores them on start.
 */
TONDAR_MODULE_EXPORT class HistoryStore : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructs a history store.
     *
     * @param registry Registry to observe and restore into, not owned.
     * @param settings Source of the "session.history" flag, not owned.
     * @param filePath JSON file holding the history.
     * @param parent Optional parent QObject.
     */
    HistoryStore(DownloadRegistry* registry,
                 SettingsStore* settings,
                 const QString& filePath,
                 QObject* parent = nullptr);

    //!< @brief Whether history persistence is switched on in the settings.
    bool isEnabled() const;

    QString filePath() const { return m_filePath; }

    /**
     * @brief Loads the persisted history into the registry.
     *
     * Does nothing while persistence is disabled.
     *
     * @return Number of records read from disk.
     */
    int restore();

    /**
     * @brief Writes the history immediately, cancelling any pending save.
     *
     * @return false when persistence is disabled or the write failed.
     */
    Q_INVOKABLE bool saveNow();

    //!< @brief Serializes one record.
    static QJsonObject encodeRecord(const tondar::Download& download);

    /**
     * @brief Parses one record.
     *
     * @return false when the record has no id or no terminal status.
     */
    static bool decodeRecord(const QJsonObject& object, tondar::Download* download);

signals:
    //!< @brief A history write failed.
    void saveFailed(const QString& error);

private:
    void scheduleSave();

    QPointer<DownloadRegistry> m_registry;  //!< Not owned.
    QPointer<SettingsStore> m_settings;     //!< Not owned.
    QString m_filePath;
    QTimer m_saveTimer;                     //!< Debounces saves.
    bool m_restoreInProgress = false;
};

#include "history_store.moc"
