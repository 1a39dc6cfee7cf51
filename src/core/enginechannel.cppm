/*!
 * @file        enginechannel.cppm
 * @brief       Boundary between the client and the external download engine.
 * @details     The engine owns every transfer; the client only observes it
 *              through a stream of typed events and drives it through four
 *              asynchronous commands. EngineChannel captures both directions
 *              in one abstract QObject so the registry can be wired to any
 *              transport (local socket, in-process bridge, test double).
 *
 *              Events are delivered as Qt signals in arrival order per
 *              download. Commands return a QFuture that resolves with a
 *              CommandResult; every call may fail independently of the
 *              others and implementations own their timeouts.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QFuture>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module tondar.core.enginechannel;
export import tondar.core.download;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

TONDAR_MODULE_EXPORT namespace tondar {

/**
 * @brief Payload of a queue event: a new download known to the engine.
 */
struct QueueEvent {
    QString id;
    QString url;
    QString fileName;
    qint64 size = -1;               //!< -1 when the engine does not know it yet.
    QString destination;
    bool resumeSupported = false;
};

/**
 * @brief Payload of a progress event.
 */
struct ProgressEvent {
    QString id;
    qint64 downloaded = 0;
    qint64 total = 0;               //!< 0 when unknown.
    double speed = 0.0;
    int progress = 0;
    QVector<Segment> segments;      //!< Optional, empty when not reported.
};

/**
 * @brief Outcome of a single engine command.
 */
struct CommandResult {
    bool ok = true;
    QString error;

    static CommandResult success() { return CommandResult{}; }
    static CommandResult failure(const QString& message) { return CommandResult{false, message}; }
};

/**
 * @brief Builds an already finished future holding @p result.
 */
QFuture<CommandResult> readyCommandResult(const CommandResult& result);

} // namespace tondar

/**
 * @brief Abstract event source and command sink of the download engine.
 */
TONDAR_MODULE_EXPORT class EngineChannel : public QObject {
    Q_OBJECT

public:
    explicit EngineChannel(QObject* parent = nullptr);
    ~EngineChannel() override;

    /**
     * @brief Enqueues one or more new downloads.
     * @param urls Source URLs.
     */
    virtual QFuture<tondar::CommandResult> start(const QStringList& urls) = 0;

    /**
     * @brief Resumes previously paused or interrupted downloads.
     * @param ids Download ids.
     */
    virtual QFuture<tondar::CommandResult> resume(const QStringList& ids) = 0;

    /**
     * @brief Pauses a download.
     */
    virtual QFuture<tondar::CommandResult> pause(const QString& id) = 0;

    /**
     * @brief Cancels a download.
     */
    virtual QFuture<tondar::CommandResult> cancel(const QString& id) = 0;

signals:
    //!< @brief A download was created by the engine.
    void queued(const tondar::QueueEvent& event);

    //!< @brief A download started transferring.
    void started(const QString& id);

    //!< @brief Transfer metrics changed.
    void progressed(const tondar::ProgressEvent& event);

    //!< @brief A download finished successfully.
    void completed(const QString& id);

    //!< @brief A download stopped with an error.
    void failed(const QString& id, const QString& error);
};

#include "enginechannel.moc"
