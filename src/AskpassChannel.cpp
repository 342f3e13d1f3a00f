#include "AskpassChannel.h"

#include <QJsonObject>

IpcReply AskpassChannel::call(const QString& command, const QJsonValue& arg)
{
    if (command != QLatin1String("askpass")) {
        return IpcReply::failure(QStringLiteral("askpass: unknown command %1").arg(command));
    }
    const QJsonObject o = arg.toObject();
    const QString id = o.value("id").toString();
    if (id.isEmpty()) {
        return IpcReply::failure(QStringLiteral("askpass: missing prompt id"));
    }

    const CredentialPromptService::Credentials creds =
        m_service.askpass(id, o.value("host").toString(), o.value("command").toString());

    QJsonObject result;
    result["username"] = creds.username;
    result["password"] = creds.password;
    return IpcReply::success(result);
}
