#include "IpcServer.h"

#include <QtNetwork/QLocalServer>
#include <QtNetwork/QLocalSocket>
#include <QDebug>

IpcServer::IpcServer(QObject* parent)
    : QObject(parent)
{
}

IpcServer::~IpcServer()
{
    dispose();
}

IpcServer::ListenStatus IpcServer::listen(const EndpointAddress& address, QString* error)
{
    if (m_disposed) {
        if (error) *error = QStringLiteral("server already disposed");
        return ListenStatus::Failed;
    }
    if (m_server) {
        if (error) *error = QStringLiteral("server already listening on %1").arg(m_address.path);
        return ListenStatus::Failed;
    }

    // Default socket options on purpose: the other options make Qt bind in a
    // temporary directory and rename over the target, which would replace a
    // live endpoint instead of reporting it as in use.
    auto* server = new QLocalServer(this);
    if (!server->listen(address.path)) {
        const QAbstractSocket::SocketError code = server->serverError();
        const QString message = server->errorString();
        delete server;
        if (error) *error = message;
        return code == QAbstractSocket::AddressInUseError ? ListenStatus::AddressInUse : ListenStatus::Failed;
    }

    m_server = server;
    m_address = address;
    connect(m_server, &QLocalServer::newConnection, this, &IpcServer::onNewConnection);
    return ListenStatus::Listening;
}

bool IpcServer::isListening() const
{
    return m_server && m_server->isListening();
}

void IpcServer::registerChannel(const QString& name, std::unique_ptr<IpcChannel> channel)
{
    if (m_disposed || !channel) return;
    if (m_channels.count(name)) {
        qWarning() << "IpcServer: replacing channel" << name;
    }
    m_channels[name] = std::move(channel);
}

bool IpcServer::hasChannel(const QString& name) const
{
    return m_channels.count(name) > 0;
}

void IpcServer::setReady()
{
    if (m_ready || m_disposed) return;
    m_ready = true;

    const QList<PendingRequest> pending = m_pending;
    m_pending.clear();
    for (const PendingRequest& p : pending) {
        if (m_disposed) break;
        if (p.socket) dispatch(p.socket, p.request);
    }
}

void IpcServer::dispose()
{
    if (m_disposed) return;
    m_disposed = true;
    m_pending.clear();

    if (m_server) {
        // closes the listener and, on Unix, removes the socket file
        m_server->close();
        m_server->deleteLater();
        m_server = nullptr;
    }

    const QList<QLocalSocket*> sockets = m_readers.keys();
    m_readers.clear();
    for (QLocalSocket* socket : sockets) {
        socket->disconnect(this);
        // outlive the listener until any pending reply has been written
        socket->setParent(nullptr);
        connect(socket, &QLocalSocket::disconnected, socket, &QObject::deleteLater);
        socket->flush();
        socket->disconnectFromServer();
        if (socket->state() == QLocalSocket::UnconnectedState) socket->deleteLater();
    }

    // A handler further up the stack may still be running.
    if (m_dispatchDepth == 0) m_channels.clear();
}

void IpcServer::onNewConnection()
{
    while (m_server && m_server->hasPendingConnections()) {
        QLocalSocket* socket = m_server->nextPendingConnection();
        if (!socket) break;
        m_readers.insert(socket, FrameReader());
        connect(socket, &QLocalSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
        connect(socket, &QLocalSocket::disconnected, this, [this, socket]() { onDisconnected(socket); });
        // data may already be buffered
        if (socket->bytesAvailable() > 0) onReadyRead(socket);
    }
}

void IpcServer::onReadyRead(QLocalSocket* socket)
{
    auto it = m_readers.find(socket);
    if (it == m_readers.end()) return;

    QString error;
    if (!it->append(socket->readAll(), &error)) {
        qWarning() << "IpcServer: dropping client:" << error;
        m_readers.erase(it);
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
        return;
    }

    QList<QJsonObject> requests;
    while (it->hasFrame()) requests.append(it->takeFrame());

    QPointer<QLocalSocket> guard(socket);
    for (const QJsonObject& request : requests) {
        if (m_disposed || !guard) break;
        if (!m_ready) {
            m_pending.append(PendingRequest{guard, request});
            continue;
        }
        dispatch(socket, request);
    }
}

void IpcServer::onDisconnected(QLocalSocket* socket)
{
    m_readers.remove(socket);
    socket->disconnect(this);
    socket->deleteLater();
}

void IpcServer::dispatch(QLocalSocket* socket, const QJsonObject& request)
{
    const int id = request.value("id").toInt(-1);
    const QString channelName = request.value("channel").toString();
    const QString command = request.value("command").toString();

    IpcReply reply;
    auto it = m_channels.find(channelName);
    if (id < 0) {
        reply = IpcReply::failure(QStringLiteral("request without id"));
    } else if (it == m_channels.end()) {
        reply = IpcReply::failure(QStringLiteral("unknown channel: %1").arg(channelName));
    } else {
        QPointer<QLocalSocket> guard(socket);
        ++m_dispatchDepth;
        reply = it->second->call(command, request.value("arg"));
        --m_dispatchDepth;
        if (m_disposed && m_dispatchDepth == 0) m_channels.clear();
        if (!guard) return;
    }

    const QJsonObject message = reply.ok
        ? IpcProtocol::makeReply(id, reply.result)
        : IpcProtocol::makeErrorReply(id, reply.error);
    if (socket->state() == QLocalSocket::ConnectedState) {
        socket->write(IpcProtocol::encodeFrame(message));
        socket->flush();
    }

    if (!reply.ok) {
        qWarning() << "IpcServer: request" << channelName << command << "failed:" << reply.error;
    }
    emit requestHandled(channelName, command, reply.ok);
}
