#include "IpcProtocol.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QtEndian>

QByteArray IpcProtocol::encodeFrame(const QJsonObject& message)
{
    const QByteArray payload = QJsonDocument(message).toJson(QJsonDocument::Compact);
    QByteArray frame(HEADER_SIZE, '\0');
    qToBigEndian<quint32>(static_cast<quint32>(payload.size()), frame.data());
    frame.append(payload);
    return frame;
}

QJsonObject IpcProtocol::makeRequest(int id, const QString& channel, const QString& command, const QJsonValue& arg)
{
    QJsonObject o;
    o["id"] = id;
    o["channel"] = channel;
    o["command"] = command;
    o["arg"] = arg;
    return o;
}

QJsonObject IpcProtocol::makeReply(int id, const QJsonValue& result)
{
    QJsonObject o;
    o["id"] = id;
    o["ok"] = true;
    o["result"] = result;
    return o;
}

QJsonObject IpcProtocol::makeErrorReply(int id, const QString& error)
{
    QJsonObject o;
    o["id"] = id;
    o["ok"] = false;
    o["error"] = error;
    return o;
}

bool FrameReader::append(const QByteArray& bytes, QString* error)
{
    m_buffer.append(bytes);

    while (m_buffer.size() >= static_cast<int>(IpcProtocol::HEADER_SIZE)) {
        const quint32 length = qFromBigEndian<quint32>(m_buffer.constData());
        if (length > IpcProtocol::MAX_FRAME_SIZE) {
            if (error) *error = QStringLiteral("frame of %1 bytes exceeds limit").arg(length);
            m_buffer.clear();
            return false;
        }
        const int total = static_cast<int>(IpcProtocol::HEADER_SIZE + length);
        if (m_buffer.size() < total) break; // wait for the rest

        const QByteArray payload = m_buffer.mid(IpcProtocol::HEADER_SIZE, length);
        m_buffer.remove(0, total);

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            if (error) {
                *error = parseError.error != QJsonParseError::NoError
                    ? QStringLiteral("malformed frame: %1").arg(parseError.errorString())
                    : QStringLiteral("frame is not a JSON object");
            }
            m_buffer.clear();
            return false;
        }
        m_frames.append(doc.object());
    }
    return true;
}

QJsonObject FrameReader::takeFrame()
{
    if (m_frames.isEmpty()) return QJsonObject();
    return m_frames.takeFirst();
}
