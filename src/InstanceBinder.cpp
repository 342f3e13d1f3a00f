#include "InstanceBinder.h"

#include <QDebug>

BindResult LocalInstanceBinder::bind(const EndpointAddress& address)
{
    auto server = std::make_unique<IpcServer>();
    QString error;
    switch (server->listen(address, &error)) {
    case IpcServer::ListenStatus::Listening:
        qInfo() << "SingleInstance: listening on" << address.path;
        return BindResult::bound(std::move(server));
    case IpcServer::ListenStatus::AddressInUse:
        return BindResult::addressInUse(error);
    case IpcServer::ListenStatus::Failed:
        break;
    }
    return BindResult::otherError(QStringLiteral("cannot listen on %1: %2").arg(address.path, error));
}
