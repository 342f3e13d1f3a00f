#pragma once

#include <QJsonValue>
#include <QString>

struct IpcReply {
    bool ok = true;
    QJsonValue result;
    QString error;

    static IpcReply success(const QJsonValue& result = QJsonValue()) { return IpcReply{true, result, QString()}; }
    static IpcReply failure(const QString& error) { return IpcReply{false, QJsonValue(), error}; }
};

// A named service exposed by IpcServer. Each inbound request is handled to
// completion on the server's thread; handlers must not assume ordering across connections.
class IpcChannel {
public:
    virtual ~IpcChannel() = default;
    virtual IpcReply call(const QString& command, const QJsonValue& arg) = 0;
};
