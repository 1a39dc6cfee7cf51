/*!
 * @file        download.cppm
 * @brief       Client-side download record and status helpers.
 * @details     Defines the row type mirrored by the download registry for
 *              every download owned by the external engine, together with
 *              the status vocabulary shared by the registry, the list model
 *              and the engine protocol.
 *
 *              A row carries the engine-reported metrics plus two pieces of
 *              client bookkeeping: a revision counter bumped on every
 *              mutation, and the optimistic command (pause or resume) that
 *              is waiting for the engine's confirmation, if any.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module tondar.core.download;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

TONDAR_MODULE_EXPORT namespace tondar {

/**
 * @brief Lifecycle status of a download.
 *
 * Queued, Downloading and Paused are active; Completed and Failed are
 * terminal and accept no further engine transitions.
 */
enum class DownloadStatus {
    Queued,
    Downloading,
    Paused,
    Completed,
    Failed
};

/**
 * @brief Filter applied by the history view.
 */
enum class HistoryFilter {
    All,        //!< Every row.
    Completed,  //!< Completed rows only.
    Incomplete  //!< Paused or downloading rows.
};

/**
 * @brief Portion of the byte range covered by one engine connection.
 *
 * Both bounds are percentages of the file (0..100), start <= end.
 */
struct Segment {
    int start = 0;
    int end = 0;

    bool operator==(const Segment& other) const = default;
};

/**
 * @brief Optimistic command awaiting the engine's confirmation.
 *
 * While kind is not None the row shows the command's target status.
 * confirmedStatus is the last status the engine stood behind, restored
 * when the command fails. token identifies the issuing command so a late
 * reply cannot revert a newer optimistic state.
 */
struct PendingCommand {
    enum class Kind {
        None,
        Pause,
        Resume
    };

    Kind kind = Kind::None;
    DownloadStatus confirmedStatus = DownloadStatus::Queued;
    qint64 pendingSince = 0;    //!< Epoch milliseconds.
    quint64 token = 0;

    bool isPending() const { return kind != Kind::None; }
};

/**
 * @brief A single download as seen by the client.
 */
struct Download {
    QString id;                     //!< Engine-assigned, never reused.
    QString url;
    QString fileName;
    QString destination;
    qint64 size = -1;               //!< Total bytes, -1 while unknown.
    qint64 downloaded = 0;          //!< Bytes received so far.
    double speed = 0.0;             //!< Bytes per second, 0 when not downloading.
    int progress = 0;               //!< Percentage 0..100.
    DownloadStatus status = DownloadStatus::Queued;
    bool resumeSupported = false;
    QVector<Segment> segments;
    QString error;                  //!< Set only when status is Failed.

    quint64 revision = 0;           //!< Bumped on every mutation of the row.
    PendingCommand pending;
    qint64 addedAt = 0;             //!< Epoch milliseconds.
    qint64 completedAt = 0;         //!< Epoch milliseconds, 0 if not completed.

    bool hasSize() const { return size >= 0; }
    bool isTerminal() const;
};

/**
 * @brief Returns the lower-case wire name of a status ("queued", "downloading", ...).
 */
QString statusToString(DownloadStatus status);

/**
 * @brief Parses a status name.
 *
 * @param name Lower-case status name.
 * @param ok Optional flag set to false when the name is unknown.
 * @return The parsed status, Queued when unknown.
 */
DownloadStatus statusFromString(const QString& name, bool* ok = nullptr);

/**
 * @brief Checks whether a status is terminal (Completed or Failed).
 */
bool isTerminalStatus(DownloadStatus status);

/**
 * @brief Checks whether a row belongs to the given history filter.
 */
bool matchesFilter(const Download& download, HistoryFilter filter);

/**
 * @brief Clamps segment bounds to 0..100 and drops inverted segments.
 */
QVector<Segment> sanitizeSegments(const QVector<Segment>& segments);

} // namespace tondar
