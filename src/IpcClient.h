#pragma once

#include <QObject>
#include <QJsonValue>
#include <functional>
#include <map>

#include "EndpointIdentity.h"
#include "IpcChannel.h"
#include "IpcProtocol.h"

class QLocalSocket;

// Client side of the IPC endpoint. All results are delivered from the event loop,
// never from inside connectTo() or call().
class IpcClient : public QObject
{
    Q_OBJECT

public:
    enum class ConnectStatus { Connected, ConnectionRefused, Failed };

    using ConnectCallback = std::function<void(ConnectStatus status, const QString& error)>;
    using ReplyCallback = std::function<void(const IpcReply& reply)>;

    explicit IpcClient(QObject* parent = nullptr);
    ~IpcClient() override;

    void connectTo(const EndpointAddress& address, ConnectCallback done);
    bool isConnected() const;

    void call(const QString& channel, const QString& command, const QJsonValue& arg, ReplyCallback done);
    int pendingCallCount() const { return static_cast<int>(m_pending.size()); }

    // Fails outstanding calls and closes the connection. Safe to call repeatedly.
    void dispose();
    bool isDisposed() const { return m_disposed; }

private:
    void onConnected();
    void onSocketError();
    void onReadyRead();
    void onDisconnected();
    void finishConnect(ConnectStatus status, const QString& error);
    void failPending(const QString& error);

    QLocalSocket* m_socket = nullptr;
    FrameReader m_reader;
    ConnectCallback m_connectCallback;
    std::map<int, ReplyCallback> m_pending;
    int m_nextId = 1;
    bool m_disposed = false;
};
