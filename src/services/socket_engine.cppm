/*!
 * @file        socket_engine.cppm
 * @brief       Engine channel over a local socket.
 * @details     Connects to the download engine process through a
 *              QLocalSocket and speaks the line-delimited JSON protocol of
 *              tondar.utils.engine_protocol.
 *
 *              Every command is numbered and resolved by the matching reply.
 *              A command that cannot be sent, is not answered in time, or is
 *              in flight when the connection drops resolves with a failure,
 *              so callers never wait forever. While disconnected the channel
 *              retries the connection periodically.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QFuture>
#include <QHash>
#include <QJsonObject>
#include <QLocalSocket>
#include <QObject>
#include <QPromise>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QTimer>

#ifndef Q_MOC_RUN
export module tondar.services.socket_engine;
export import tondar.core.enginechannel;
#endif

#ifdef Q_MOC_RUN
#define TONDAR_MODULE_EXPORT
#else
#define TONDAR_MODULE_EXPORT export
#endif

/**
 * @brief EngineChannel implementation talking to the engine over QLocalSocket.
 */
TONDAR_MODULE_EXPORT class SocketEngine : public EngineChannel {
    Q_OBJECT

    //!< @brief True while the socket is connected to the engine.
    Q_PROPERTY(bool connected READ isConnected NOTIFY connectedChanged)

public:
    /**
     * @brief Constructs a disconnected channel.
     *
     * @param serverName Name of the engine's local server.
     * @param parent Optional parent QObject.
     */
    explicit SocketEngine(const QString& serverName, QObject* parent = nullptr);

    ~SocketEngine() override;

    /**
     * @brief Connects to the engine and keeps reconnecting while it is away.
     */
    void connectToEngine();

    /**
     * @brief Drops the connection and stops reconnecting.
     */
    void disconnectFromEngine();

    bool isConnected() const;

    QString serverName() const { return m_serverName; }

    //!< @brief Time a command may wait for its reply, in milliseconds.
    void setRequestTimeout(int msec) { m_requestTimeout = msec; }

    //!< @brief Delay between reconnection attempts, in milliseconds.
    void setReconnectInterval(int msec);

    QFuture<tondar::CommandResult> start(const QStringList& urls) override;

    QFuture<tondar::CommandResult> resume(const QStringList& ids) override;

    QFuture<tondar::CommandResult> pause(const QString& id) override;

    QFuture<tondar::CommandResult> cancel(const QString& id) override;

signals:
    void connectedChanged();

private slots:
    void onConnected();

    void onDisconnected();

    void onReadyRead();

private:
    quint64 nextRequest() { return ++m_lastRequest; }

    QFuture<tondar::CommandResult> send(quint64 request, const QJsonObject& message);

    void resolve(quint64 request, const tondar::CommandResult& result);

    void failAll(const QString& error);

    void handleLine(const QByteArray& line);

    QString m_serverName;
    QLocalSocket* m_socket = nullptr;
    QTimer m_reconnectTimer;
    bool m_autoReconnect = false;
    int m_requestTimeout = 15000;
    quint64 m_lastRequest = 0;

    //!< @brief Commands awaiting a reply, by request number.
    QHash<quint64, QSharedPointer<QPromise<tondar::CommandResult>>> m_pending;
};

#include "socket_engine.moc"
