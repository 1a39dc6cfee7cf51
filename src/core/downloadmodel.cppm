/*!
 * @file        downloadmodel.cppm
 * @brief       QAbstractListModel exposing a registry view to QML.
 * @details     Presents one read view of the DownloadRegistry (the overview
 *              ordering or a filtered history) as a Qt item model with
 *              custom roles for QML delegates.
 *
 *              The model keeps a snapshot of the view it last published.
 *              After every registry mutation it recomputes the view; when
 *              the row ids and their order are unchanged only the rows whose
 *              revision moved are reported through dataChanged, otherwise
 *              the model is reset.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QPointer>
#include <QStringList>
#include <QVariant>
#include <QVector>

#ifndef Q_MOC_RUN
export module tondar.core.downloadmodel;
export import tondar.core.downloadregistry;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

/**
 * @brief Qt list model over the overview or history view of the registry.
 */
TONDAR_MODULE_EXPORT class DownloadModel : public QAbstractListModel {
    Q_OBJECT

    //!< @brief Which registry view the model publishes.
    Q_PROPERTY(View view READ view WRITE setView NOTIFY viewChanged)

    //!< @brief History filter, applied when view is HistoryView.
    Q_PROPERTY(Filter filter READ filter WRITE setFilter NOTIFY filterChanged)

    //!< @brief Number of rows currently published.
    Q_PROPERTY(int count READ count NOTIFY countChanged)

public:
    enum View {
        OverviewView,   //!< Active rows first, by descending progress
        HistoryView     //!< Insertion order, filtered
    };
    Q_ENUM(View)

    enum Filter {
        AllFilter,
        CompletedFilter,
        IncompleteFilter
    };
    Q_ENUM(Filter)

    /**
     * @brief Custom model roles exposed to QML.
     */
    enum Roles {
        IdRole = Qt::UserRole + 1,  //!< Engine id
        UrlRole,                    //!< Source URL
        FileNameRole,               //!< Display file name
        SizeRole,                   //!< Total bytes, -1 while unknown
        DownloadedRole,             //!< Bytes received
        SpeedRole,                  //!< Bytes per second
        ProgressRole,               //!< Percentage 0..100
        StatusRole,                 //!< Lower-case status name
        DestinationRole,            //!< Target directory or path
        ResumeSupportedRole,        //!< Whether the engine can resume
        SegmentsRole,               //!< List of { start, end } percentages
        ErrorRole,                  //!< Failure message
        CategoryRole,               //!< File-type category
        ExtensionRole,              //!< Upper-case extension label
        SizeTextRole,               //!< Formatted size
        SpeedTextRole,              //!< Formatted speed
        TimeLeftRole,               //!< Formatted remaining time
        PendingRole                 //!< An optimistic command awaits the engine
    };

    /**
     * @brief Constructs a model over @p registry.
     *
     * @param registry Source registry, not owned.
     * @param parent Optional QObject parent.
     */
    explicit DownloadModel(DownloadRegistry* registry, QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;

    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;

    QHash<int, QByteArray> roleNames() const override;

    View view() const { return m_view; }
    void setView(View view);

    Filter filter() const { return m_filter; }
    void setFilter(Filter filter);

    int count() const { return m_rows.size(); }

    /**
     * @brief Ids of the published rows, in display order.
     *
     * Intended for SelectionSet::toggleAll().
     */
    Q_INVOKABLE QStringList ids() const;

    //!< @brief Id of the row at @p row, empty when out of range.
    Q_INVOKABLE QString idAt(int row) const;

    /**
     * @brief Recomputes the view from the registry.
     */
    Q_INVOKABLE void refresh();

signals:
    void viewChanged();
    void filterChanged();
    void countChanged();

private:
    QVector<tondar::Download> currentView() const;

    QPointer<DownloadRegistry> m_registry;   //!< Source, not owned.
    QVector<tondar::Download> m_rows;        //!< Published snapshot.
    View m_view = OverviewView;
    Filter m_filter = AllFilter;
};

#include "downloadmodel.moc"
