#include "LifecycleChannel.h"

#include <QTimer>
#include <QDebug>

IpcReply LifecycleChannel::call(const QString& command, const QJsonValue& arg)
{
    if (command != QLatin1String("exit")) {
        return IpcReply::failure(QStringLiteral("lifecycle: unknown command %1").arg(command));
    }
    const int code = arg.toInt(0);
    qInfo() << "Lifecycle: exit requested over IPC, code" << code;

    auto onExit = m_onExit;
    QTimer::singleShot(0, [onExit, code]() {
        if (onExit) onExit(code);
    });
    return IpcReply::success(code);
}
