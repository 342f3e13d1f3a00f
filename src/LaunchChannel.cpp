#include "LaunchChannel.h"
#include "IpcClient.h"

IpcReply LaunchChannel::call(const QString& command, const QJsonValue& arg)
{
    if (command != QLatin1String("start")) {
        return IpcReply::failure(QStringLiteral("launch: unknown command %1").arg(command));
    }

    LaunchRequest request;
    QString error;
    if (!LaunchRequest::fromJson(arg.toObject(), &request, &error)) {
        return IpcReply::failure(error);
    }
    if (!m_service.start(request, &error)) {
        return IpcReply::failure(error.isEmpty() ? QStringLiteral("launch rejected") : error);
    }
    return IpcReply::success(true);
}

void LaunchChannelClient::start(const LaunchRequest& request, Callback done)
{
    m_client.call(QString::fromLatin1(LaunchChannel::NAME), QStringLiteral("start"), request.toJson(),
                  [done](const IpcReply& reply) { done(reply.ok, reply.error); });
}
