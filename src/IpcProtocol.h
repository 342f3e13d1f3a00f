#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>

// Wire format shared by IpcServer and IpcClient:
// a 4-byte big-endian payload length followed by a compact JSON object.
class IpcProtocol {
public:
    static constexpr quint32 HEADER_SIZE = 4;
    static constexpr quint32 MAX_FRAME_SIZE = 16 * 1024 * 1024;

    static QByteArray encodeFrame(const QJsonObject& message);

    static QJsonObject makeRequest(int id, const QString& channel, const QString& command, const QJsonValue& arg);
    static QJsonObject makeReply(int id, const QJsonValue& result);
    static QJsonObject makeErrorReply(int id, const QString& error);
};

// Accumulates bytes from a socket and splits them into decoded frames.
class FrameReader {
public:
    // Returns false on a protocol violation; the connection must then be dropped.
    bool append(const QByteArray& bytes, QString* error = nullptr);

    bool hasFrame() const { return !m_frames.isEmpty(); }
    QJsonObject takeFrame();

    int bufferedBytes() const { return m_buffer.size(); }

private:
    QByteArray m_buffer;
    QList<QJsonObject> m_frames;
};
