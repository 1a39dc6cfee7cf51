/*!
 * @file        settings_backend.cppm
 * @brief       Persistence boundary of the settings store.
 * @details     SettingsBackend abstracts where the settings document lives.
 *              The store calls load() from a worker thread once per process
 *              and save() on the owning thread for every mutation.
 *
 *              JsonFileSettingsBackend keeps the document in a JSON file as
 *              { "settings": { ... } } and replaces the file atomically on
 *              every write.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QString>

#ifndef Q_MOC_RUN
export module tondar.services.settings_backend;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

/**
 * @brief Abstract storage of the settings document.
 */
TONDAR_MODULE_EXPORT class SettingsBackend {
public:
    virtual ~SettingsBackend() = default;

    /**
     * @brief Reads the persisted document.
     *
     * A store that has never been written loads successfully as an empty
     * document.
     *
     * @param document Receives the persisted document.
     * @param error Receives a message on failure, may be null.
     * @return true on success.
     */
    virtual bool load(QJsonObject* document, QString* error) = 0;

    /**
     * @brief Persists the full document.
     *
     * @param document Document to write.
     * @param error Receives a message on failure, may be null.
     * @return true once the document is durably stored.
     */
    virtual bool save(const QJsonObject& document, QString* error) = 0;
};

/**
 * @brief Settings backend storing the document in a JSON file.
 */
TONDAR_MODULE_EXPORT class JsonFileSettingsBackend : public SettingsBackend {
public:
    /**
     * @param filePath Absolute path of the JSON file.
     */
    explicit JsonFileSettingsBackend(const QString& filePath);

    bool load(QJsonObject* document, QString* error) override;

    bool save(const QJsonObject& document, QString* error) override;

    //!< @brief Path of the backing file.
    QString filePath() const { return m_filePath; }

private:
    QString m_filePath;
};
