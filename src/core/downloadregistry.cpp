module;
#include <algorithm>
#include <QDateTime>
#include <QDebug>
#include <QFuture>
#include <QFutureWatcher>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

module tondar.core.downloadregistry;

using tondar::CommandResult;
using tondar::Download;
using tondar::DownloadStatus;
using tondar::PendingCommand;

DownloadRegistry::DownloadRegistry(EngineChannel* engine, QObject* parent)
    : QObject(parent),
    m_engine(engine)
{
    if (!engine) return;
    connect(engine, &EngineChannel::queued, this, &DownloadRegistry::onQueued);
    connect(engine, &EngineChannel::started, this, &DownloadRegistry::onStarted);
    connect(engine, &EngineChannel::progressed, this, &DownloadRegistry::onProgress);
    connect(engine, &EngineChannel::completed, this, &DownloadRegistry::onCompleted);
    connect(engine, &EngineChannel::failed, this, &DownloadRegistry::onFailed);
}

const Download* DownloadRegistry::find(const QString& id) const
{
    const auto it = m_index.constFind(id);
    if (it == m_index.constEnd()) return nullptr;
    return &m_rows.at(it.value());
}

Download* DownloadRegistry::row(const QString& id)
{
    const auto it = m_index.constFind(id);
    if (it == m_index.constEnd()) return nullptr;
    return &m_rows[it.value()];
}

int DownloadRegistry::activeCount() const
{
    int n = 0;
    for (const Download& d : m_rows) {
        if (d.status == DownloadStatus::Downloading || d.status == DownloadStatus::Paused) ++n;
    }
    return n;
}

int DownloadRegistry::completedCount() const
{
    int n = 0;
    for (const Download& d : m_rows) {
        if (d.status == DownloadStatus::Completed) ++n;
    }
    return n;
}

double DownloadRegistry::totalSpeed() const
{
    double total = 0.0;
    for (const Download& d : m_rows) {
        if (d.status == DownloadStatus::Downloading) total += d.speed;
    }
    return total;
}

QVector<Download> DownloadRegistry::activeDownloads() const
{
    QVector<Download> out;
    for (const Download& d : m_rows) {
        if (d.status == DownloadStatus::Downloading || d.status == DownloadStatus::Paused) out.append(d);
    }
    return out;
}

QVector<Download> DownloadRegistry::overview() const
{
    QVector<Download> out = m_rows;
    std::stable_sort(out.begin(), out.end(), [](const Download& a, const Download& b) {
        const bool ta = a.isTerminal();
        const bool tb = b.isTerminal();
        if (ta != tb) return !ta;
        return a.progress > b.progress;
    });
    return out;
}

QVector<Download> DownloadRegistry::history(tondar::HistoryFilter filter) const
{
    QVector<Download> out;
    for (const Download& d : m_rows) {
        if (tondar::matchesFilter(d, filter)) out.append(d);
    }
    return out;
}

void DownloadRegistry::clearError()
{
    setError(QString());
}

// ---------------------------------------------------------------------------
// Engine events
// ---------------------------------------------------------------------------

void DownloadRegistry::onQueued(const tondar::QueueEvent& event)
{
    if (event.id.isEmpty()) {
        qWarning() << "Ignoring queue event without id";
        return;
    }

    Download fresh;
    fresh.id = event.id;
    fresh.url = event.url;
    fresh.fileName = event.fileName;
    fresh.destination = event.destination;
    fresh.size = event.size >= 0 ? event.size : -1;
    fresh.resumeSupported = event.resumeSupported;
    fresh.status = DownloadStatus::Queued;
    fresh.addedAt = QDateTime::currentMSecsSinceEpoch();

    if (Download* existing = row(event.id)) {
        // Re-queued by the engine (e.g. resumed from history): same position, fresh state.
        fresh.revision = existing->revision;
        fresh.addedAt = existing->addedAt;
        *existing = fresh;
        touch(*existing);
        emit downloadUpdated(event.id);
        emit downloadsChanged();
        return;
    }

    fresh.revision = 1;
    m_index.insert(fresh.id, m_rows.size());
    m_rows.append(fresh);
    emit downloadAdded(event.id);
    emit downloadsChanged();
}

void DownloadRegistry::onStarted(const QString& id)
{
    Download* d = row(id);
    if (!d) {
        qDebug() << "Ignoring start event for unknown download" << id;
        return;
    }
    if (d->isTerminal()) return;
    if (d->pending.kind == PendingCommand::Kind::Pause) {
        qDebug() << "Ignoring stale start event for download being paused" << id;
        return;
    }

    const DownloadStatus confirmed = d->pending.isPending() ? d->pending.confirmedStatus : d->status;
    if (confirmed == DownloadStatus::Paused && !d->resumeSupported) {
        d->downloaded = 0;
        d->progress = 0;
        d->segments.clear();
    }
    d->status = DownloadStatus::Downloading;
    d->pending = PendingCommand();
    touch(*d);
    emit downloadUpdated(id);
    emit downloadsChanged();
}

void DownloadRegistry::onProgress(const tondar::ProgressEvent& event)
{
    Download* d = row(event.id);
    if (!d) {
        qDebug() << "Ignoring progress event for unknown download" << event.id;
        return;
    }
    // Terminal rows are final and paused rows no longer transfer: late ticks are stale.
    if (d->isTerminal() || d->status == DownloadStatus::Paused) return;

    // The engine may skip the start event; the first tick starts the row.
    const bool promoted = d->status == DownloadStatus::Queued;
    // A non-resumable row resumed from Paused starts over from byte zero.
    const bool restarting = d->pending.kind == PendingCommand::Kind::Resume
                            && d->pending.confirmedStatus == DownloadStatus::Paused
                            && !d->resumeSupported;
    if (promoted) d->status = DownloadStatus::Downloading;
    if (restarting && event.segments.isEmpty()) d->segments.clear();

    const qint64 reported = qMax<qint64>(0, event.downloaded);
    d->downloaded = promoted || restarting ? reported : qMax(d->downloaded, reported);
    d->speed = qMax(0.0, event.speed);
    d->progress = qBound(0, event.progress, 100);
    if (event.total > 0) d->size = event.total;
    if (!event.segments.isEmpty()) d->segments = tondar::sanitizeSegments(event.segments);
    touch(*d);
    emit downloadUpdated(event.id);
    emit downloadsChanged();
}

void DownloadRegistry::onCompleted(const QString& id)
{
    Download* d = row(id);
    if (!d) {
        qDebug() << "Ignoring complete event for unknown download" << id;
        return;
    }
    if (d->isTerminal()) return;

    d->status = DownloadStatus::Completed;
    d->progress = 100;
    d->speed = 0.0;
    d->error.clear();
    d->pending = PendingCommand();
    d->completedAt = QDateTime::currentMSecsSinceEpoch();
    touch(*d);
    emit downloadUpdated(id);
    emit downloadsChanged();
}

void DownloadRegistry::onFailed(const QString& id, const QString& error)
{
    Download* d = row(id);
    if (!d) {
        qDebug() << "Ignoring failure event for unknown download" << id;
        return;
    }
    if (d->isTerminal()) return;

    d->status = DownloadStatus::Failed;
    d->error = error.isEmpty() ? QStringLiteral("Download failed") : error;
    d->speed = 0.0;
    d->pending = PendingCommand();
    touch(*d);
    emit downloadUpdated(id);
    emit downloadsChanged();
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

void DownloadRegistry::startDownloads(const QStringList& urls)
{
    setError(QString());

    QStringList cleaned;
    for (const QString& url : urls) {
        const QString trimmed = url.trimmed();
        if (!trimmed.isEmpty()) cleaned.append(trimmed);
    }
    if (cleaned.isEmpty()) return;

    if (!m_engine) {
        reportFailure(QStringLiteral("start"), QStringLiteral("Download engine is not available"));
        return;
    }
    track(QStringLiteral("start"), m_engine->start(cleaned), {});
}

void DownloadRegistry::resumeDownloads(const QStringList& ids)
{
    setError(QString());
    if (ids.isEmpty()) return;

    QHash<QString, quint64> tokens;
    bool changed = false;
    for (const QString& id : ids) {
        Download* d = row(id);
        if (!d || d->status != DownloadStatus::Paused) continue;
        tokens.insert(id, beginPending(*d, PendingCommand::Kind::Resume));
        d->status = DownloadStatus::Downloading;
        touch(*d);
        emit downloadUpdated(id);
        changed = true;
    }
    if (changed) emit downloadsChanged();

    if (!m_engine) {
        settle(tokens, false);
        reportFailure(QStringLiteral("resume"), QStringLiteral("Download engine is not available"));
        return;
    }
    track(QStringLiteral("resume"), m_engine->resume(ids), tokens);
}

void DownloadRegistry::pauseDownload(const QString& id)
{
    QHash<QString, quint64> tokens;
    if (Download* d = row(id)) {
        if (d->status == DownloadStatus::Downloading || d->status == DownloadStatus::Paused) {
            tokens.insert(id, beginPending(*d, PendingCommand::Kind::Pause));
            d->status = DownloadStatus::Paused;
            d->speed = 0.0;
            touch(*d);
            emit downloadUpdated(id);
            emit downloadsChanged();
        }
    }

    if (!m_engine) {
        settle(tokens, false);
        reportFailure(QStringLiteral("pause"), QStringLiteral("Download engine is not available"));
        return;
    }
    track(QStringLiteral("pause"), m_engine->pause(id), tokens);
}

void DownloadRegistry::cancelDownload(const QString& id)
{
    const auto it = m_index.constFind(id);
    if (it != m_index.constEnd()) {
        removeRow(it.value());
        emit downloadRemoved(id);
        emit downloadsChanged();
    }

    if (!m_engine) {
        reportFailure(QStringLiteral("cancel"), QStringLiteral("Download engine is not available"));
        return;
    }
    track(QStringLiteral("cancel"), m_engine->cancel(id), {});
}

void DownloadRegistry::resumeSelection(SelectionSet* selection)
{
    if (!selection) return;
    const QStringList ids = selection->ids();
    resumeDownloads(ids);
}

void DownloadRegistry::cancelSelection(SelectionSet* selection)
{
    if (!selection) return;
    const QStringList ids = selection->ids();
    for (const QString& id : ids) {
        cancelDownload(id);
    }
}

void DownloadRegistry::clearFinished()
{
    QStringList removed;
    for (int i = m_rows.size() - 1; i >= 0; --i) {
        if (!m_rows.at(i).isTerminal()) continue;
        removed.prepend(m_rows.at(i).id);
        m_rows.removeAt(i);
    }
    if (removed.isEmpty()) return;
    rebuildIndex();
    for (const QString& id : removed) emit downloadRemoved(id);
    emit downloadsChanged();
}

void DownloadRegistry::restoreHistory(const QVector<Download>& records)
{
    bool changed = false;
    for (Download record : records) {
        if (record.id.isEmpty() || !record.isTerminal() || m_index.contains(record.id)) continue;
        record.speed = 0.0;
        record.pending = PendingCommand();
        if (record.status == DownloadStatus::Completed) record.progress = 100;
        record.revision = 1;
        m_index.insert(record.id, m_rows.size());
        m_rows.append(record);
        emit downloadAdded(record.id);
        changed = true;
    }
    if (changed) emit downloadsChanged();
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

void DownloadRegistry::touch(Download& download)
{
    ++download.revision;
}

quint64 DownloadRegistry::beginPending(Download& download, PendingCommand::Kind kind)
{
    PendingCommand pending;
    pending.kind = kind;
    pending.confirmedStatus = download.pending.isPending() ? download.pending.confirmedStatus : download.status;
    pending.pendingSince = QDateTime::currentMSecsSinceEpoch();
    pending.token = ++m_nextToken;
    download.pending = pending;
    return pending.token;
}

void DownloadRegistry::track(const QString& command,
                             const QFuture<CommandResult>& future,
                             const QHash<QString, quint64>& tokens)
{
    auto* watcher = new QFutureWatcher<CommandResult>(this);
    connect(watcher, &QFutureWatcher<CommandResult>::finished, this, [this, watcher, command, tokens]() {
        CommandResult result = CommandResult::failure(QStringLiteral("Command was cancelled"));
        if (!watcher->isCanceled() && watcher->future().resultCount() > 0) {
            result = watcher->result();
        }
        watcher->deleteLater();

        settle(tokens, result.ok);
        if (!result.ok) reportFailure(command, result.error);
    });
    watcher->setFuture(future);
}

void DownloadRegistry::settle(const QHash<QString, quint64>& tokens, bool accepted)
{
    bool changed = false;
    for (auto it = tokens.constBegin(); it != tokens.constEnd(); ++it) {
        Download* d = row(it.key());
        // Row removed, settled by an event, or superseded by a newer command.
        if (!d || !d->pending.isPending() || d->pending.token != it.value()) continue;

        if (!accepted) {
            d->status = d->pending.confirmedStatus;
            if (d->status != DownloadStatus::Downloading) d->speed = 0.0;
        }
        d->pending = PendingCommand();
        touch(*d);
        emit downloadUpdated(it.key());
        changed = true;
    }
    if (changed) emit downloadsChanged();
}

void DownloadRegistry::reportFailure(const QString& command, const QString& error)
{
    const QString message = error.isEmpty() ? QStringLiteral("%1 failed").arg(command) : error;
    qWarning() << "Download command" << command << "failed:" << message;
    setError(message);
    emit commandFailed(command, message);
}

void DownloadRegistry::setError(const QString& error)
{
    if (m_lastError == error) return;
    m_lastError = error;
    emit errorChanged();
}

void DownloadRegistry::removeRow(int index)
{
    if (index < 0 || index >= m_rows.size()) return;
    m_rows.removeAt(index);
    rebuildIndex();
}

void DownloadRegistry::rebuildIndex()
{
    m_index.clear();
    m_index.reserve(m_rows.size());
    for (int i = 0; i < m_rows.size(); ++i) {
        m_index.insert(m_rows.at(i).id, i);
    }
}
