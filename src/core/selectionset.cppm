/*!
 * @file        selectionset.cppm
 * @brief       Presentation-owned selection of download rows.
 * @details     Tracks which rows the user ticked in a list view. The set is
 *              owned by the page that renders the view, never by the
 *              registry; registry bulk helpers only take a snapshot of it.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module tondar.core.selectionset;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

/**
 * @brief Set of selected download ids with toggle semantics.
 */
TONDAR_MODULE_EXPORT class SelectionSet : public QObject {
    Q_OBJECT

    //!< @brief Number of selected ids.
    Q_PROPERTY(int count READ count NOTIFY changed)

public:
    explicit SelectionSet(QObject* parent = nullptr);

    /**
     * @brief Adds @p id when absent, removes it otherwise.
     */
    Q_INVOKABLE void toggle(const QString& id);

    /**
     * @brief Select-all checkbox behaviour for the current view.
     *
     * When the selection already holds as many ids as the view shows it is
     * cleared; otherwise it becomes exactly the view's ids. Two consecutive
     * calls therefore return to an empty selection.
     *
     * @param viewIds Ids of the currently filtered and sorted view.
     */
    Q_INVOKABLE void toggleAll(const QStringList& viewIds);

    //!< @brief Whether @p id is selected.
    Q_INVOKABLE bool contains(const QString& id) const { return m_ids.contains(id); }

    //!< @brief Number of selected ids.
    int count() const { return m_ids.size(); }

    /**
     * @brief Returns the selected ids, sorted for deterministic iteration.
     */
    Q_INVOKABLE QStringList ids() const;

    Q_INVOKABLE void clear();

    /**
     * @brief Drops selected ids that are not part of @p visibleIds.
     */
    Q_INVOKABLE void retainOnly(const QStringList& visibleIds);

signals:
    void changed();

private:
    QSet<QString> m_ids;
};

#include "selectionset.moc"
