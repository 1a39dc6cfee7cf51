module;
#include <QString>
#include <QVector>
#include <QtGlobal>

module tondar.core.download;

namespace tondar {

bool Download::isTerminal() const
{
    return isTerminalStatus(status);
}

QString statusToString(DownloadStatus status)
{
    switch (status) {
    case DownloadStatus::Queued: return QStringLiteral("queued");
    case DownloadStatus::Downloading: return QStringLiteral("downloading");
    case DownloadStatus::Paused: return QStringLiteral("paused");
    case DownloadStatus::Completed: return QStringLiteral("completed");
    case DownloadStatus::Failed: return QStringLiteral("failed");
    }
    return QStringLiteral("queued");
}

DownloadStatus statusFromString(const QString& name, bool* ok)
{
    const QString n = name.trimmed().toLower();
    if (ok) *ok = true;
    if (n == "queued") return DownloadStatus::Queued;
    if (n == "downloading") return DownloadStatus::Downloading;
    if (n == "paused") return DownloadStatus::Paused;
    if (n == "completed") return DownloadStatus::Completed;
    if (n == "failed") return DownloadStatus::Failed;
    if (ok) *ok = false;
    return DownloadStatus::Queued;
}

bool isTerminalStatus(DownloadStatus status)
{
    return status == DownloadStatus::Completed || status == DownloadStatus::Failed;
}

bool matchesFilter(const Download& download, HistoryFilter filter)
{
    switch (filter) {
    case HistoryFilter::All:
        return true;
    case HistoryFilter::Completed:
        return download.status == DownloadStatus::Completed;
    case HistoryFilter::Incomplete:
        return download.status == DownloadStatus::Paused
            || download.status == DownloadStatus::Downloading;
    }
    return true;
}

QVector<Segment> sanitizeSegments(const QVector<Segment>& segments)
{
    QVector<Segment> out;
    out.reserve(segments.size());
    for (const Segment& s : segments) {
        const int start = qBound(0, s.start, 100);
        const int end = qBound(0, s.end, 100);
        if (start > end) continue;
        out.append(Segment{start, end});
    }
    return out;
}

} // namespace tondar
