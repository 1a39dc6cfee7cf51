module;
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

module tondar.utils.engine_protocol;
import tondar.utils.number_utils;

namespace tondar::utils {

static void setError(QString* error, const QString& message)
{
    if (error) *error = message;
}

static QVector<Segment> readSegments(const QJsonValue& value)
{
    QVector<Segment> out;
    const QJsonArray array = value.toArray();
    for (const QJsonValue& v : array) {
        const QJsonObject o = v.toObject();
        if (!o.value("start").isDouble() || !o.value("end").isDouble()) continue;
        Segment s;
        s.start = readInt(o.value("start"), 0);
        s.end = readInt(o.value("end"), 0);
        out.append(s);
    }
    return out;
}

static QJsonObject makeRequest(quint64 request, const QString& command, const QJsonObject& args)
{
    QJsonObject out;
    out.insert("request", static_cast<double>(request));
    out.insert("command", command);
    out.insert("args", args);
    return out;
}

static QJsonObject downloadRequest(quint64 request, const QString& type, const QStringList& data)
{
    QJsonObject inner;
    inner.insert("type", type);
    inner.insert("data", QJsonArray::fromStringList(data));
    QJsonObject args;
    args.insert("request", inner);
    return makeRequest(request, QStringLiteral("handle_download_request"), args);
}

static QJsonObject idRequest(quint64 request, const QString& command, const QString& id)
{
    QJsonObject args;
    args.insert("id", id);
    return makeRequest(request, command, args);
}

bool isReplyMessage(const QJsonObject& message)
{
    return message.contains("reply");
}

bool isEventMessage(const QJsonObject& message)
{
    return message.value("event").isString();
}

bool decodeEvent(const QJsonObject& message, EngineEvent* event, QString* error)
{
    if (!event) return false;

    const QString name = message.value("event").toString();
    const QJsonObject payload = message.value("payload").toObject();
    const QString id = payload.value("id").toString();
    if (id.isEmpty()) {
        setError(error, QStringLiteral("Event %1 has no id").arg(name));
        return false;
    }

    EngineEvent out;
    out.id = id;
    if (name == "queue_download") {
        out.kind = EngineEvent::Kind::Queued;
        out.queue.id = id;
        out.queue.url = payload.value("url").toString();
        out.queue.fileName = payload.value("filename").toString();
        out.queue.size = readInt64(payload.value("size"), -1);
        out.queue.destination = payload.value("destination").toString();
        out.queue.resumeSupported = payload.value("resume_supported").toBool();
    } else if (name == "download_started") {
        out.kind = EngineEvent::Kind::Started;
    } else if (name == "download_progress") {
        out.kind = EngineEvent::Kind::Progress;
        out.progress.id = id;
        out.progress.downloaded = readInt64(payload.value("downloaded"), 0);
        out.progress.total = readInt64(payload.value("total"), 0);
        out.progress.speed = payload.value("speed").toDouble();
        out.progress.progress = qRound(qBound(0.0, payload.value("progress").toDouble(), 100.0));
        out.progress.segments = readSegments(payload.value("segments"));
    } else if (name == "download_complete") {
        out.kind = EngineEvent::Kind::Completed;
    } else if (name == "download_failed") {
        out.kind = EngineEvent::Kind::Failed;
        out.error = payload.value("error").toString();
    } else {
        setError(error, QStringLiteral("Unknown engine event: %1").arg(name));
        return false;
    }

    *event = out;
    return true;
}

bool decodeReply(const QJsonObject& message, EngineReply* reply, QString* error)
{
    if (!reply) return false;
    const QJsonValue request = message.value("reply");
    if (!request.isDouble() || request.toDouble() < 0 || !isSafeInteger(request.toDouble())) {
        setError(error, QStringLiteral("Reply without a request number"));
        return false;
    }
    reply->request = static_cast<quint64>(request.toDouble());
    reply->ok = message.value("ok").toBool(false);
    reply->error = message.value("error").toString();
    return true;
}

QJsonObject encodeStartRequest(quint64 request, const QStringList& urls)
{
    return downloadRequest(request, QStringLiteral("New"), urls);
}

QJsonObject encodeResumeRequest(quint64 request, const QStringList& ids)
{
    return downloadRequest(request, QStringLiteral("Resume"), ids);
}

QJsonObject encodePauseRequest(quint64 request, const QString& id)
{
    return idRequest(request, QStringLiteral("pause_download"), id);
}

QJsonObject encodeCancelRequest(quint64 request, const QString& id)
{
    return idRequest(request, QStringLiteral("cancel_download"), id);
}

QByteArray frameMessage(const QJsonObject& message)
{
    QByteArray out = QJsonDocument(message).toJson(QJsonDocument::Compact);
    out.append('\n');
    return out;
}

bool parseMessage(const QByteArray& line, QJsonObject* message, QString* error)
{
    if (!message) return false;
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        setError(error, QStringLiteral("Message is not a JSON object"));
        return false;
    }
    *message = doc.object();
    return true;
}

} // namespace tondar::utils
