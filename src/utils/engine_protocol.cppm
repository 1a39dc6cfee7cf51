/*!
 * @file        engine_protocol.cppm
 * @brief       Wire format spoken with the download engine process.
 * @details     Messages are single-line JSON objects separated by '\n'.
 *
 *              Client to engine:
 *                { "request": n, "command": "handle_download_request",
 *                  "args": { "request": { "type": "New" | "Resume", "data": [...] } } }
 *                { "request": n, "command": "pause_download",  "args": { "id": "..." } }
 *                { "request": n, "command": "cancel_download", "args": { "id": "..." } }
 *
 *              Engine to client:
 *                { "reply": n, "ok": true | false, "error": "..." }
 *                { "event": "queue_download" | "download_started" |
 *                           "download_progress" | "download_complete" |
 *                           "download_failed",
 *                  "payload": { "id": "...", ... } }
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module tondar.utils.engine_protocol;
export import tondar.core.enginechannel;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

TONDAR_MODULE_EXPORT namespace tondar::utils {

/**
 * @brief A decoded engine event.
 *
 * Only the member matching kind is meaningful; id is always set.
 */
struct EngineEvent {
    enum class Kind {
        Queued,
        Started,
        Progress,
        Completed,
        Failed
    };

    Kind kind = Kind::Started;
    QString id;
    tondar::QueueEvent queue;
    tondar::ProgressEvent progress;
    QString error;
};

//!< @brief A decoded command reply.
struct EngineReply {
    quint64 request = 0;
    bool ok = false;
    QString error;
};

//!< @brief Whether @p message is a command reply.
bool isReplyMessage(const QJsonObject& message);

//!< @brief Whether @p message is an engine event.
bool isEventMessage(const QJsonObject& message);

/**
 * @brief Decodes an event message.
 *
 * Rejects unknown event names and payloads without a non-empty id.
 *
 * @return true when @p event was filled.
 */
bool decodeEvent(const QJsonObject& message, EngineEvent* event, QString* error = nullptr);

/**
 * @brief Decodes a reply message.
 *
 * A missing "ok" flag is read as a failure.
 */
bool decodeReply(const QJsonObject& message, EngineReply* reply, QString* error = nullptr);

QJsonObject encodeStartRequest(quint64 request, const QStringList& urls);

QJsonObject encodeResumeRequest(quint64 request, const QStringList& ids);

QJsonObject encodePauseRequest(quint64 request, const QString& id);

QJsonObject encodeCancelRequest(quint64 request, const QString& id);

/**
 * @brief Serializes a message as one compact line terminated by '\n'.
 */
QByteArray frameMessage(const QJsonObject& message);

/**
 * @brief Parses one line received from the engine.
 *
 * @return false when the line is not a JSON object.
 */
bool parseMessage(const QByteArray& line, QJsonObject* message, QString* error = nullptr);

} // namespace tondar::utils
