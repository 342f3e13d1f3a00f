#include "LaunchForwarder.h"
#include "IpcClient.h"
#include "LaunchChannel.h"

#include <QPointer>
#include <QDebug>
#include <memory>

LocalLaunchForwarder::LocalLaunchForwarder(bool testSession, QObject* parent)
    : QObject(parent)
    , m_testSession(testSession)
{
}

void LocalLaunchForwarder::connectAndForward(const EndpointAddress& address, const LaunchRequest& request, Callback done)
{
    // The connection is released on every path once the last callback holding it is gone.
    QPointer<LocalLaunchForwarder> self(this);
    ++m_openConnections;
    std::shared_ptr<IpcClient> client(new IpcClient(), [self](IpcClient* c) {
        c->dispose();
        c->deleteLater();
        if (self) --self->m_openConnections;
    });

    const bool testSession = m_testSession;
    client->connectTo(address, [client, request, done, testSession](IpcClient::ConnectStatus status, const QString& error) {
        if (status == IpcClient::ConnectStatus::ConnectionRefused) {
            client->dispose();
            done(ForwardResult::connectionRefused(error));
            return;
        }
        if (status == IpcClient::ConnectStatus::Failed) {
            client->dispose();
            done(ForwardResult::failed(StartupError::ForwardFailed, error));
            return;
        }

        if (testSession) {
            const QString msg = QStringLiteral("Running tests from the command line is only supported "
                                               "if no other instance is running.");
            qCritical().noquote() << msg;
            client->dispose();
            done(ForwardResult::failed(StartupError::TestSessionConflict, msg));
            return;
        }

        qInfo() << "SingleInstance: sending launch request to running instance...";
        LaunchChannelClient launch(*client);
        launch.start(request, [client, done](bool ok, const QString& error) {
            client->dispose();
            if (ok) {
                done(ForwardResult::sent());
            } else {
                done(ForwardResult::failed(StartupError::ForwardFailed,
                                           QStringLiteral("running instance rejected launch: %1").arg(error)));
            }
        });
    });
}
