module;
#include <QByteArray>
#include <QDebug>
#include <QFuture>
#include <QHash>
#include <QJsonObject>
#include <QLocalSocket>
#include <QPromise>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QTimer>

module tondar.services.socket_engine;

import tondar.utils.engine_protocol;

namespace utils = tondar::utils;

using tondar::CommandResult;

SocketEngine::SocketEngine(const QString& serverName, QObject* parent)
    : EngineChannel(parent),
    m_serverName(serverName),
    m_socket(new QLocalSocket(this))
{
    m_reconnectTimer.setInterval(2000);
    connect(&m_reconnectTimer, &QTimer::timeout, this, [this]() {
        if (m_socket->state() == QLocalSocket::UnconnectedState) {
            m_socket->connectToServer(m_serverName);
        }
    });

    connect(m_socket, &QLocalSocket::connected, this, &SocketEngine::onConnected);
    connect(m_socket, &QLocalSocket::disconnected, this, &SocketEngine::onDisconnected);
    connect(m_socket, &QLocalSocket::readyRead, this, &SocketEngine::onReadyRead);
    connect(m_socket, &QLocalSocket::errorOccurred, this, [this](QLocalSocket::LocalSocketError) {
        qDebug() << "Engine socket error:" << m_socket->errorString();
        if (m_autoReconnect && !m_reconnectTimer.isActive()) m_reconnectTimer.start();
    });
}

SocketEngine::~SocketEngine()
{
    QObject::disconnect(m_socket, nullptr, this, nullptr);
    failAll(QStringLiteral("Engine disconnected"));
}

void SocketEngine::connectToEngine()
{
    m_autoReconnect = true;
    if (m_socket->state() == QLocalSocket::UnconnectedState) {
        m_socket->connectToServer(m_serverName);
    }
}

void SocketEngine::disconnectFromEngine()
{
    m_autoReconnect = false;
    m_reconnectTimer.stop();
    m_socket->abort();
    failAll(QStringLiteral("Engine disconnected"));
}

bool SocketEngine::isConnected() const
{
    return m_socket->state() == QLocalSocket::ConnectedState;
}

void SocketEngine::setReconnectInterval(int msec)
{
    m_reconnectTimer.setInterval(msec);
}

QFuture<CommandResult> SocketEngine::start(const QStringList& urls)
{
    const quint64 n = nextRequest();
    return send(n, utils::encodeStartRequest(n, urls));
}

QFuture<CommandResult> SocketEngine::resume(const QStringList& ids)
{
    const quint64 n = nextRequest();
    return send(n, utils::encodeResumeRequest(n, ids));
}

QFuture<CommandResult> SocketEngine::pause(const QString& id)
{
    const quint64 n = nextRequest();
    return send(n, utils::encodePauseRequest(n, id));
}

QFuture<CommandResult> SocketEngine::cancel(const QString& id)
{
    const quint64 n = nextRequest();
    return send(n, utils::encodeCancelRequest(n, id));
}

QFuture<CommandResult> SocketEngine::send(quint64 request, const QJsonObject& message)
{
    if (!isConnected()) {
        return tondar::readyCommandResult(CommandResult::failure(QStringLiteral("Engine is not connected")));
    }

    auto promise = QSharedPointer<QPromise<CommandResult>>::create();
    promise->start();
    m_pending.insert(request, promise);

    if (m_socket->write(utils::frameMessage(message)) < 0) {
        resolve(request, CommandResult::failure(m_socket->errorString()));
        return promise->future();
    }

    QTimer::singleShot(m_requestTimeout, this, [this, request]() {
        if (m_pending.contains(request)) {
            qWarning() << "Engine request" << request << "timed out";
            resolve(request, CommandResult::failure(QStringLiteral("Engine request timed out")));
        }
    });
    return promise->future();
}

void SocketEngine::resolve(quint64 request, const CommandResult& result)
{
    const auto promise = m_pending.take(request);
    if (!promise) return;
    promise->addResult(result);
    promise->finish();
}

void SocketEngine::failAll(const QString& error)
{
    const QList<quint64> requests = m_pending.keys();
    for (quint64 request : requests) {
        resolve(request, CommandResult::failure(error));
    }
}

void SocketEngine::onConnected()
{
    qInfo() << "Connected to download engine" << m_serverName;
    m_reconnectTimer.stop();
    emit connectedChanged();
}

void SocketEngine::onDisconnected()
{
    qWarning() << "Download engine disconnected";
    failAll(QStringLiteral("Engine disconnected"));
    emit connectedChanged();
    if (m_autoReconnect) m_reconnectTimer.start();
}

void SocketEngine::onReadyRead()
{
    while (m_socket->canReadLine()) {
        const QByteArray line = m_socket->readLine().trimmed();
        if (line.isEmpty()) continue;
        handleLine(line);
    }
}

void SocketEngine::handleLine(const QByteArray& line)
{
    QJsonObject message;
    QString error;
    if (!utils::parseMessage(line, &message, &error)) {
        qWarning() << "Dropping malformed engine message:" << error;
        return;
    }

    if (utils::isReplyMessage(message)) {
        utils::EngineReply reply;
        if (!utils::decodeReply(message, &reply, &error)) {
            qWarning() << "Dropping engine reply:" << error;
            return;
        }
        if (reply.ok) {
            resolve(reply.request, CommandResult::success());
        } else {
            resolve(reply.request, CommandResult::failure(
                reply.error.isEmpty() ? QStringLiteral("Engine rejected the command") : reply.error));
        }
        return;
    }

    if (!utils::isEventMessage(message)) {
        qWarning() << "Dropping engine message that is neither a reply nor an event";
        return;
    }

    utils::EngineEvent event;
    if (!utils::decodeEvent(message, &event, &error)) {
        qWarning() << "Dropping engine event:" << error;
        return;
    }

    switch (event.kind) {
    case utils::EngineEvent::Kind::Queued:
        emit queued(event.queue);
        break;
    case utils::EngineEvent::Kind::Started:
        emit started(event.id);
        break;
    case utils::EngineEvent::Kind::Progress:
        emit progressed(event.progress);
        break;
    case utils::EngineEvent::Kind::Completed:
        emit completed(event.id);
        break;
    case utils::EngineEvent::Kind::Failed:
        emit failed(event.id, event.error);
        break;
    }
}
