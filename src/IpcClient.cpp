#include "IpcClient.h"

#include <QtNetwork/QLocalSocket>
#include <QMetaObject>
#include <QDebug>

IpcClient::IpcClient(QObject* parent)
    : QObject(parent)
    , m_socket(new QLocalSocket(this))
{
    connect(m_socket, &QLocalSocket::connected, this, &IpcClient::onConnected);
    connect(m_socket, &QLocalSocket::errorOccurred, this, &IpcClient::onSocketError);
    connect(m_socket, &QLocalSocket::readyRead, this, &IpcClient::onReadyRead);
    connect(m_socket, &QLocalSocket::disconnected, this, &IpcClient::onDisconnected);
}

IpcClient::~IpcClient()
{
    m_connectCallback = nullptr;
    dispose();
}

void IpcClient::connectTo(const EndpointAddress& address, ConnectCallback done)
{
    if (m_disposed || m_socket->state() != QLocalSocket::UnconnectedState) {
        const QString error = m_disposed ? QStringLiteral("client disposed") : QStringLiteral("client already connected");
        QMetaObject::invokeMethod(this, [done, error]() { done(ConnectStatus::Failed, error); }, Qt::QueuedConnection);
        return;
    }
    m_connectCallback = std::move(done);
    m_socket->connectToServer(address.path);
}

bool IpcClient::isConnected() const
{
    return !m_disposed && m_socket->state() == QLocalSocket::ConnectedState;
}

void IpcClient::call(const QString& channel, const QString& command, const QJsonValue& arg, ReplyCallback done)
{
    if (!isConnected()) {
        QMetaObject::invokeMethod(this, [done]() { done(IpcReply::failure(QStringLiteral("not connected"))); },
                                  Qt::QueuedConnection);
        return;
    }
    const int id = m_nextId++;
    m_pending[id] = std::move(done);
    m_socket->write(IpcProtocol::encodeFrame(IpcProtocol::makeRequest(id, channel, command, arg)));
    m_socket->flush();
}

void IpcClient::dispose()
{
    if (m_disposed) return;
    m_disposed = true;

    failPending(QStringLiteral("connection disposed"));
    if (m_connectCallback) finishConnect(ConnectStatus::Failed, QStringLiteral("connection disposed"));

    m_socket->disconnect(this);
    if (m_socket->state() != QLocalSocket::UnconnectedState) {
        m_socket->flush();
        m_socket->disconnectFromServer();
    }
}

void IpcClient::onConnected()
{
    finishConnect(ConnectStatus::Connected, QString());
}

void IpcClient::onSocketError()
{
    const QLocalSocket::LocalSocketError code = m_socket->error();
    const QString message = m_socket->errorString();

    if (m_connectCallback) {
        // The endpoint exists but nobody accepts on it: a stale handle.
        finishConnect(code == QLocalSocket::ConnectionRefusedError ? ConnectStatus::ConnectionRefused
                                                                   : ConnectStatus::Failed,
                      message);
        return;
    }
    if (code != QLocalSocket::PeerClosedError) failPending(message);
}

void IpcClient::onReadyRead()
{
    QString error;
    if (!m_reader.append(m_socket->readAll(), &error)) {
        qWarning() << "IpcClient: protocol error:" << error;
        failPending(error);
        m_socket->abort();
        return;
    }

    while (m_reader.hasFrame()) {
        const QJsonObject reply = m_reader.takeFrame();
        auto it = m_pending.find(reply.value("id").toInt(-1));
        if (it == m_pending.end()) {
            qWarning() << "IpcClient: reply for unknown request" << reply.value("id").toInt(-1);
            continue;
        }
        ReplyCallback done = std::move(it->second);
        m_pending.erase(it);
        if (reply.value("ok").toBool()) {
            done(IpcReply::success(reply.value("result")));
        } else {
            done(IpcReply::failure(reply.value("error").toString()));
        }
        if (m_disposed) return;
    }
}

void IpcClient::onDisconnected()
{
    failPending(QStringLiteral("connection closed by peer"));
}

void IpcClient::finishConnect(ConnectStatus status, const QString& error)
{
    ConnectCallback done = std::move(m_connectCallback);
    m_connectCallback = nullptr;
    if (!done) return;
    // Qt may report the outcome synchronously from connectToServer(); always deliver from the loop.
    QMetaObject::invokeMethod(this, [done, status, error]() { done(status, error); }, Qt::QueuedConnection);
}

void IpcClient::failPending(const QString& error)
{
    std::map<int, ReplyCallback> pending;
    pending.swap(m_pending);
    for (auto& entry : pending) {
        entry.second(IpcReply::failure(error));
    }
}
