/*!
 * @file        settingsstore.cppm
 * @brief       Application settings store.
 * @details     Holds the nested settings document, loads it once per process
 *              in the background and persists every change before it becomes
 *              visible. Reads before the load completes are served from the
 *              compiled-in defaults overlaid with the fast-path cache, so the
 *              first window can be painted with the right theme.
 *
 *              Keys are addressed by dotted paths ("app.theme"). The default
 *              document is the schema: a write must target one of its leaf
 *              paths and carry the same JSON type.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QFutureWatcher>
#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QString>
#include <QVariant>

#ifndef Q_MOC_RUN
export module tondar.core.settingsstore;
export import tondar.core.appsettings;
export import tondar.services.settings_backend;
export import tondar.services.fastpath_cache;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

TONDAR_MODULE_EXPORT namespace tondar {

//!< @brief Outcome of the background settings load.
struct SettingsLoadResult {
    bool ok = false;
    QJsonObject document;
    QString error;
};

} // namespace tondar

/**
 * @brief Process-wide settings document with asynchronous load and
 *        synchronous, persist-first writes.
 */
TONDAR_MODULE_EXPORT class SettingsStore : public QObject {
    Q_OBJECT

    //!< @brief True once the persisted document has been loaded (or failed to load).
    Q_PROPERTY(bool ready READ isReady NOTIFY readyChanged)

    //!< @brief Current "app.theme" value.
    Q_PROPERTY(QString theme READ theme NOTIFY settingsChanged)

    //!< @brief Current "app.sidebar" value.
    Q_PROPERTY(QString sidebar READ sidebar NOTIFY settingsChanged)

    //!< @brief Current "app.show_download_progress" value.
    Q_PROPERTY(bool showDownloadProgress READ showDownloadProgress NOTIFY settingsChanged)

    //!< @brief Message of the last rejected write from QML.
    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)

public:
    /**
     * @brief Constructs a store serving defaults overlaid with the cache.
     *
     * @param backend Persistence backend, not owned. Must outlive the store.
     * @param cache Optional fast-path cache, not owned.
     * @param parent Optional parent QObject.
     */
    explicit SettingsStore(SettingsBackend* backend,
                           FastPathCache* cache = nullptr,
                           QObject* parent = nullptr);

    ~SettingsStore() override;

    /**
     * @brief Starts loading the persisted document in the background.
     *
     * Calls while a load is running or after the store is ready are ignored.
     */
    Q_INVOKABLE void load();

    bool isReady() const { return m_ready; }

    //!< @brief Full current document.
    QJsonObject document() const { return m_document; }

    /**
     * @brief Looks up a dotted path.
     *
     * @return The value, or an undefined QJsonValue when a segment is missing.
     */
    QJsonValue value(const QString& path) const;

    //!< @brief QML accessor for value().
    Q_INVOKABLE QVariant get(const QString& path) const;

    /**
     * @brief Writes one setting.
     *
     * The new document is persisted first and only then replaces the
     * current one, so a failed write leaves every reader unaffected.
     *
     * @param path Dotted leaf path of the default document.
     * @param value New value; must carry the default's JSON type.
     * @param error Receives the reason of a rejection, may be null.
     * @return true when the value is stored.
     */
    bool setValue(const QString& path, const QJsonValue& value, QString* error = nullptr);

    /**
     * @brief QML wrapper of setValue() recording lastError.
     */
    Q_INVOKABLE bool set(const QString& path, const QVariant& value);

    //!< @brief Typed snapshot of the current document.
    tondar::AppSettings settings() const;

    /**
     * @brief Subset of the document consumed by the download engine
     *        ("download", "thread" and "session" groups).
     */
    QJsonObject backendSettings() const;

    //!< @brief Whether @p path names a leaf of the default document.
    static bool isKnownPath(const QString& path);

    QString theme() const;

    QString sidebar() const;

    bool showDownloadProgress() const;

    QString lastError() const { return m_lastError; }

signals:
    //!< @brief The store became ready. Emitted once.
    void readyChanged();

    //!< @brief The document was replaced.
    void settingsChanged();

    //!< @brief A single setting changed.
    void valueChanged(const QString& path);

    void lastErrorChanged();

private:
    void applyLoaded(const tondar::SettingsLoadResult& result);

    void mirrorFastPath();

    void setLastError(const QString& error);

    SettingsBackend* m_backend = nullptr;                                //!< Not owned.
    FastPathCache* m_cache = nullptr;                                    //!< Not owned.
    QJsonObject m_document;                                              //!< Current document.
    bool m_ready = false;
    bool m_loading = false;
    QString m_lastError;
    QFutureWatcher<tondar::SettingsLoadResult>* m_loadWatcher = nullptr; //!< Running load, if any.
};

#include "settingsstore.moc"
