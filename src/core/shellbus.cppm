/*!
 * @file        shellbus.cppm
 * @brief       Typed notifications between the shell and its pages.
 * @details     Pages and the window frame never reach into each other. They
 *              talk through this object, owned by the shell, whose signals
 *              name every cross-page request (open the add dialog, toggle
 *              the sidebar, navigate, quit) and whose homeEmpty property
 *              reflects whether the home page has anything to show.
 *
 *              Keyboard shortcuts are resolved here as well: handleShortcut()
 *              matches a key press against the bindings in the settings
 *              store and raises the corresponding request.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QPointer>
#include <QString>

#ifndef Q_MOC_RUN
export module tondar.core.shellbus;
export import tondar.core.settingsstore;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

/**
 * @brief Shell-scoped signal hub replacing ad-hoc window events.
 */
TONDAR_MODULE_EXPORT class ShellBus : public QObject {
    Q_OBJECT

    //!< @brief True while the home page shows its empty state.
    Q_PROPERTY(bool homeEmpty READ homeEmpty WRITE setHomeEmpty NOTIFY homeEmptyChanged)

public:
    /**
     * @param settings Source of the shortcut bindings, not owned. May be null.
     * @param parent Optional parent QObject.
     */
    explicit ShellBus(SettingsStore* settings = nullptr, QObject* parent = nullptr);

    bool homeEmpty() const { return m_homeEmpty; }
    void setHomeEmpty(bool empty);

    /**
     * @brief Dispatches a key press bound in the "shortcuts" settings group.
     *
     * Bindings are only honoured once the settings store is ready. The
     * sidebar toggle is suppressed while the home page is empty.
     *
     * @param key Key name as typed, compared case-insensitively.
     * @return true when the press triggered a request.
     */
    Q_INVOKABLE bool handleShortcut(bool ctrl, bool shift, bool alt, bool meta, const QString& key);

signals:
    void homeEmptyChanged(bool empty);

    //!< @brief The add-download dialog should open.
    void addDownloadRequested();

    void sidebarToggleRequested();

    //!< @brief The focused download should be cancelled.
    void cancelDownloadRequested();

    /**
     * @brief A page change was requested.
     * @param page One of "home", "settings", "detail", "history".
     */
    void navigationRequested(const QString& page);

    void quitRequested();

private:
    QPointer<SettingsStore> m_settings;
    bool m_homeEmpty = false;
};

#include "shellbus.moc"
