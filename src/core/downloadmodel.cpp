module;
#include <utility>
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QModelIndex>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantList>
#include <QVariantMap>
#include <QVector>
#include <QtGlobal>

module tondar.core.downloadmodel;

import tondar.utils.category_utils;
import tondar.utils.format_utils;

namespace utils = tondar::utils;

using tondar::Download;

static tondar::HistoryFilter toHistoryFilter(DownloadModel::Filter filter)
{
    switch (filter) {
    case DownloadModel::CompletedFilter: return tondar::HistoryFilter::Completed;
    case DownloadModel::IncompleteFilter: return tondar::HistoryFilter::Incomplete;
    case DownloadModel::AllFilter: break;
    }
    return tondar::HistoryFilter::All;
}

static QVariantList segmentList(const QVector<tondar::Segment>& segments)
{
    QVariantList out;
    out.reserve(segments.size());
    for (const tondar::Segment& s : segments) {
        QVariantMap m;
        m.insert(QStringLiteral("start"), s.start);
        m.insert(QStringLiteral("end"), s.end);
        out.append(m);
    }
    return out;
}

DownloadModel::DownloadModel(DownloadRegistry* registry, QObject* parent)
    : QAbstractListModel(parent),
    m_registry(registry)
{
    if (registry) {
        connect(registry, &DownloadRegistry::downloadsChanged, this, &DownloadModel::refresh);
    }
    m_rows = currentView();
}

int DownloadModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    return m_rows.size();
}

QVariant DownloadModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || index.row() >= m_rows.size()) return {};
    const Download& item = m_rows[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole: return item.fileName;
    case IdRole: return item.id;
    case UrlRole: return item.url;
    case SizeRole: return item.size;
    case DownloadedRole: return item.downloaded;
    case SpeedRole: return item.speed;
    case ProgressRole: return item.progress;
    case StatusRole: return tondar::statusToString(item.status);
    case DestinationRole: return item.destination;
    case ResumeSupportedRole: return item.resumeSupported;
    case SegmentsRole: return segmentList(item.segments);
    case ErrorRole: return item.error;
    case CategoryRole: return utils::detectCategory(item.fileName);
    case ExtensionRole: return utils::extensionLabel(item.fileName);
    case SizeTextRole: return item.hasSize() ? utils::formatSize(item.size) : QStringLiteral("Unknown");
    case SpeedTextRole: return utils::formatSpeed(item.speed);
    case TimeLeftRole: return utils::formatTimeLeft(item.downloaded, item.size, item.speed);
    case PendingRole: return item.pending.isPending();
    }
    return {};
}

QHash<int, QByteArray> DownloadModel::roleNames() const {
    return {
        {IdRole, "id"},
        {UrlRole, "url"},
        {FileNameRole, "fileName"},
        {SizeRole, "size"},
        {DownloadedRole, "downloaded"},
        {SpeedRole, "speed"},
        {ProgressRole, "progress"},
        {StatusRole, "status"},
        {DestinationRole, "destination"},
        {ResumeSupportedRole, "resumeSupported"},
        {SegmentsRole, "segments"},
        {ErrorRole, "error"},
        {CategoryRole, "category"},
        {ExtensionRole, "extension"},
        {SizeTextRole, "sizeText"},
        {SpeedTextRole, "speedText"},
        {TimeLeftRole, "timeLeft"},
        {PendingRole, "pending"}
    };
}

void DownloadModel::setView(View view)
{
    if (m_view == view) return;
    m_view = view;
    emit viewChanged();
    refresh();
}

void DownloadModel::setFilter(Filter filter)
{
    if (m_filter == filter) return;
    m_filter = filter;
    emit filterChanged();
    if (m_view == HistoryView) refresh();
}

QStringList DownloadModel::ids() const
{
    QStringList out;
    out.reserve(m_rows.size());
    for (const Download& d : m_rows) out.append(d.id);
    return out;
}

QString DownloadModel::idAt(int row) const
{
    if (row < 0 || row >= m_rows.size()) return QString();
    return m_rows[row].id;
}

QVector<Download> DownloadModel::currentView() const
{
    if (!m_registry) return {};
    if (m_view == HistoryView) return m_registry->history(toHistoryFilter(m_filter));
    return m_registry->overview();
}

void DownloadModel::refresh()
{
    QVector<Download> next = currentView();

    bool sameShape = next.size() == m_rows.size();
    for (int i = 0; sameShape && i < next.size(); ++i) {
        if (next[i].id != m_rows[i].id) sameShape = false;
    }

    if (!sameShape) {
        const int before = m_rows.size();
        beginResetModel();
        m_rows = std::move(next);
        endResetModel();
        if (before != m_rows.size()) emit countChanged();
        return;
    }

    QVector<int> changed;
    for (int i = 0; i < next.size(); ++i) {
        if (next[i].revision != m_rows[i].revision) changed.append(i);
    }
    m_rows = std::move(next);
    for (int i : changed) {
        const QModelIndex idx = index(i);
        emit dataChanged(idx, idx);
    }
}
