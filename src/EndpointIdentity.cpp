#include "EndpointIdentity.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>

static const QString MAIN_SUFFIX = QStringLiteral(".sock");
static const QString SHARED_SUFFIX = QStringLiteral("-shared.sock");

EndpointIdentity EndpointIdentity::derive(const QString& productName,
                                          const QString& userName,
                                          const QString& handleDirectory,
                                          bool isBuilt)
{
    QString name = productName;
    if (!isBuilt) name += QStringLiteral("-dev");

    // Make the handle unique per logged in user so several users can run the app side by side.
    QString user = sanitizeUserName(userName);
    if (user.isEmpty() && !userName.isEmpty()) user = shortHash(userName, 8);
    if (!user.isEmpty()) name += QLatin1Char('-') + user;

    EndpointIdentity id;
    id.m_handleDirectory = handleDirectory.isEmpty() ? defaultHandleDirectory() : QDir::cleanPath(handleDirectory);

#ifndef Q_OS_WIN
    // The longer of the two paths decides; both must fit into sun_path.
    const QString longest = addressFor(id.m_handleDirectory, name, SHARED_SUFFIX).path;
    if (QFile::encodeName(longest).size() > MAX_UNIX_PATH_LENGTH) {
        name = productName + QLatin1Char('-') + shortHash(name, 16);
    }
#endif

    id.m_handleName = name;
    id.m_main = addressFor(id.m_handleDirectory, name, MAIN_SUFFIX);
    id.m_shared = addressFor(id.m_handleDirectory, name, SHARED_SUFFIX);
    return id;
}

QString EndpointIdentity::currentUserName(const QProcessEnvironment& env)
{
    for (const char* key : {"USER", "USERNAME", "LOGNAME"}) {
        const QString value = env.value(QString::fromLatin1(key)).trimmed();
        if (!value.isEmpty()) return value;
    }
    return QString();
}

QString EndpointIdentity::defaultHandleDirectory()
{
    return QDir::cleanPath(QDir::tempPath());
}

QString EndpointIdentity::lockFilePath() const
{
    return QDir(m_handleDirectory).filePath(m_handleName + QStringLiteral(".lock"));
}

QString EndpointIdentity::sanitizeUserName(const QString& userName)
{
    QString out;
    const QString lower = userName.toLower();
    for (const QChar c : lower) {
        const ushort u = c.unicode();
        if ((u >= 'a' && u <= 'z') || (u >= '0' && u <= '9') || u == '_') out.append(c);
    }
    return out;
}

QString EndpointIdentity::shortHash(const QString& value, int hexChars)
{
    const QByteArray digest = QCryptographicHash::hash(value.toUtf8(), QCryptographicHash::Sha256).toHex();
    return QString::fromLatin1(digest.left(hexChars));
}

EndpointAddress EndpointIdentity::addressFor(const QString& directory, const QString& name, const QString& suffix)
{
#ifdef Q_OS_WIN
    Q_UNUSED(directory);
    return EndpointAddress{QStringLiteral("\\\\.\\pipe\\") + name + suffix};
#else
    return EndpointAddress{QDir(directory).filePath(name + suffix)};
#endif
}
