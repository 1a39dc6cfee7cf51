/*!
 * @file        downloadregistry.cppm
 * @brief       Client-side registry of downloads owned by the engine.
 * @details     Holds the canonical in-memory table of every download the
 *              client knows about and keeps it consistent with the engine:
 *
 *              - Engine events are applied in arrival order and never throw;
 *                events for unknown ids are ignored.
 *              - User commands are forwarded to the engine. Pause, resume and
 *                cancel update the table optimistically before the engine
 *                answers; a failed pause or resume reverts the row to the
 *                last status the engine confirmed, a cancel is final.
 *              - Read views (overview ordering, history filter, active set)
 *                are recomputed from the table on demand and never mutate it.
 *
 *              All mutations happen on the thread that owns the registry, so
 *              the table needs no locking.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QFuture>
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module tondar.core.downloadregistry;
export import tondar.core.download;
export import tondar.core.enginechannel;
export import tondar.core.selectionset;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

/**
 * @brief Single source of truth for what the UI shows about downloads.
 *
 * The registry listens to an EngineChannel for state changes and issues
 * commands through it. Pages consume its read views and the signals
 * emitted after each mutation.
 */
TONDAR_MODULE_EXPORT class DownloadRegistry : public QObject {
    Q_OBJECT

    //!< @brief Number of rows in the table.
    Q_PROPERTY(int count READ count NOTIFY downloadsChanged)

    //!< @brief Number of downloading or paused rows.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY downloadsChanged)

    //!< @brief Number of completed rows.
    Q_PROPERTY(int completedCount READ completedCount NOTIFY downloadsChanged)

    //!< @brief Aggregate speed of downloading rows (bytes/sec).
    Q_PROPERTY(double totalSpeed READ totalSpeed NOTIFY downloadsChanged)

    //!< @brief Last command failure, empty when none.
    Q_PROPERTY(QString lastError READ lastError NOTIFY errorChanged)

public:
    /**
     * @brief Constructs a registry bound to an engine channel.
     *
     * The registry connects to every engine event signal. The engine is
     * not owned; when it is destroyed further commands fail with an error.
     *
     * @param engine Engine channel, may be null.
     * @param parent Optional parent QObject.
     */
    explicit DownloadRegistry(EngineChannel* engine, QObject* parent = nullptr);

    //!< @brief All rows in insertion order.
    QVector<tondar::Download> downloads() const { return m_rows; }

    /**
     * @brief Looks up a row by id.
     *
     * The returned pointer is invalidated by the next mutation.
     *
     * @return The row, or nullptr when unknown.
     */
    const tondar::Download* find(const QString& id) const;

    Q_INVOKABLE bool contains(const QString& id) const { return m_index.contains(id); }

    int count() const { return m_rows.size(); }

    int activeCount() const;

    int completedCount() const;

    double totalSpeed() const;

    /**
     * @brief Rows whose status is Downloading or Paused, in insertion order.
     */
    QVector<tondar::Download> activeDownloads() const;

    /**
     * @brief Rows ordered for the overview page.
     *
     * Non-terminal rows come before terminal ones; each group is sorted by
     * descending progress. The sort is stable, so rows with equal keys keep
     * their insertion order.
     */
    QVector<tondar::Download> overview() const;

    /**
     * @brief Rows matching a history filter, in insertion order.
     */
    QVector<tondar::Download> history(tondar::HistoryFilter filter) const;

    //!< @brief Last command failure message.
    QString lastError() const { return m_lastError; }

    Q_INVOKABLE void clearError();

    /**
     * @brief Asks the engine to enqueue new downloads.
     *
     * Blank entries are dropped. No row is created locally; rows appear
     * when the engine emits the matching queue events.
     *
     * @param urls Source URLs.
     */
    Q_INVOKABLE void startDownloads(const QStringList& urls);

    /**
     * @brief Resumes downloads.
     *
     * Paused rows switch to Downloading immediately and revert to their
     * confirmed status if the engine rejects the command.
     *
     * @param ids Download ids.
     */
    Q_INVOKABLE void resumeDownloads(const QStringList& ids);

    /**
     * @brief Pauses a download.
     *
     * A downloading or paused row switches to Paused immediately and
     * reverts to its confirmed status if the engine rejects the command.
     */
    Q_INVOKABLE void pauseDownload(const QString& id);

    /**
     * @brief Cancels a download.
     *
     * The row is removed immediately regardless of the engine's answer.
     */
    Q_INVOKABLE void cancelDownload(const QString& id);

    /**
     * @brief Resumes every selected download.
     *
     * The selection is read once; later changes to it do not affect the
     * commands already issued.
     */
    Q_INVOKABLE void resumeSelection(SelectionSet* selection);

    /**
     * @brief Cancels every selected download.
     *
     * The selection is read once before any row is removed.
     */
    Q_INVOKABLE void cancelSelection(SelectionSet* selection);

    /**
     * @brief Removes completed and failed rows without contacting the engine.
     */
    Q_INVOKABLE void clearFinished();

    /**
     * @brief Inserts persisted terminal records at startup.
     *
     * Non-terminal records and ids already present are skipped.
     */
    void restoreHistory(const QVector<tondar::Download>& records);

public slots:
    void onQueued(const tondar::QueueEvent& event);

    void onStarted(const QString& id);

    void onProgress(const tondar::ProgressEvent& event);

    void onCompleted(const QString& id);

    void onFailed(const QString& id, const QString& error);

signals:
    //!< @brief A row was inserted.
    void downloadAdded(const QString& id);

    //!< @brief A row changed in place.
    void downloadUpdated(const QString& id);

    //!< @brief A row was removed.
    void downloadRemoved(const QString& id);

    //!< @brief Emitted once after every mutation of the table.
    void downloadsChanged();

    //!< @brief lastError changed.
    void errorChanged();

    /**
     * @brief A command was rejected or errored.
     * @param command One of "start", "resume", "pause", "cancel".
     * @param error Message suitable for inline display.
     */
    void commandFailed(const QString& command, const QString& error);

private:
    tondar::Download* row(const QString& id);

    //!< @brief Bumps the revision of a row after a mutation.
    void touch(tondar::Download& download);

    //!< @brief Records an optimistic command on a row and returns its token.
    quint64 beginPending(tondar::Download& download, tondar::PendingCommand::Kind kind);

    //!< @brief Watches a command reply and settles optimistic rows when it resolves.
    void track(const QString& command,
               const QFuture<tondar::CommandResult>& future,
               const QHash<QString, quint64>& tokens);

    void settle(const QHash<QString, quint64>& tokens, bool accepted);

    void reportFailure(const QString& command, const QString& error);

    void setError(const QString& error);

    void removeRow(int index);

    void rebuildIndex();

    QPointer<EngineChannel> m_engine;       //!< Engine boundary, not owned.
    QVector<tondar::Download> m_rows;       //!< Rows in insertion order.
    QHash<QString, int> m_index;            //!< Id to row position.
    quint64 m_nextToken = 0;                //!< Source of optimistic command tokens.
    QString m_lastError;                    //!< Last command failure.
};

#include "downloadregistry.moc"
