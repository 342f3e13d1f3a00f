#pragma once

#include <QObject>
#include <QHash>
#include <QList>
#include <QPointer>
#include <QJsonObject>
#include <map>
#include <memory>

#include "EndpointIdentity.h"
#include "IpcChannel.h"
#include "IpcProtocol.h"

class QLocalServer;
class QLocalSocket;

/**
 * IpcServer: the listening side of the single-instance endpoint.
 *
 * Owning an IpcServer that listens means this process owns the endpoint.
 * Channels are registered after a successful listen(); requests that arrive
 * before setReady() are queued and dispatched in arrival order once the
 * server is ready, so no request can observe a half-registered server.
 */
class IpcServer : public QObject
{
    Q_OBJECT

public:
    enum class ListenStatus { Listening, AddressInUse, Failed };

    explicit IpcServer(QObject* parent = nullptr);
    ~IpcServer() override;

    ListenStatus listen(const EndpointAddress& address, QString* error = nullptr);
    bool isListening() const;
    EndpointAddress address() const { return m_address; }

    void registerChannel(const QString& name, std::unique_ptr<IpcChannel> channel);
    bool hasChannel(const QString& name) const;

    void setReady();
    bool isReady() const { return m_ready; }

    // Stops listening, flushes and disconnects clients, drops channels. Safe to call repeatedly.
    void dispose();
    bool isDisposed() const { return m_disposed; }

    int connectionCount() const { return m_readers.size(); }
    int pendingRequestCount() const { return m_pending.size(); }

signals:
    void requestHandled(const QString& channel, const QString& command, bool ok);

private slots:
    void onNewConnection();

private:
    struct PendingRequest {
        QPointer<QLocalSocket> socket;
        QJsonObject request;
    };

    void onReadyRead(QLocalSocket* socket);
    void onDisconnected(QLocalSocket* socket);
    void dispatch(QLocalSocket* socket, const QJsonObject& request);

    QLocalServer* m_server = nullptr;
    EndpointAddress m_address;
    std::map<QString, std::unique_ptr<IpcChannel>> m_channels;
    QHash<QLocalSocket*, FrameReader> m_readers;
    QList<PendingRequest> m_pending;
    int m_dispatchDepth = 0;
    bool m_ready = false;
    bool m_disposed = false;
};
