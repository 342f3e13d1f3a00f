#pragma once

#include <QString>
#include <QProcessEnvironment>

// Local communication address every instance of the application agrees on.
// On Unix this is a socket path, on Windows a named pipe.
struct EndpointAddress {
    QString path;

    bool isEmpty() const { return path.isEmpty(); }
    bool operator==(const EndpointAddress& other) const { return path == other.path; }
    bool operator!=(const EndpointAddress& other) const { return path != other.path; }
};

/**
 * EndpointIdentity: derives the per-user IPC handle names.
 *
 * Derivation is pure: the same product name, user and handle directory always
 * produce the same addresses, so every process of one installation meets at the
 * same endpoint without persisting anything.
 */
class EndpointIdentity {
public:
    // sizeof(sockaddr_un::sun_path) minus the terminating NUL on Linux.
    static constexpr int MAX_UNIX_PATH_LENGTH = 107;

    static EndpointIdentity derive(const QString& productName,
                                   const QString& userName,
                                   const QString& handleDirectory,
                                   bool isBuilt);

    // USER, then USERNAME, then LOGNAME.
    static QString currentUserName(const QProcessEnvironment& env);

    // System temp directory; used when no override is configured.
    static QString defaultHandleDirectory();

    QString handleName() const { return m_handleName; }
    QString handleDirectory() const { return m_handleDirectory; }

    EndpointAddress mainAddress() const { return m_main; }
    EndpointAddress sharedAddress() const { return m_shared; }

    // Path of the QLockFile used as a secondary single-instance hint.
    QString lockFilePath() const;

private:
    EndpointIdentity() = default;

    static QString sanitizeUserName(const QString& userName);
    static QString shortHash(const QString& value, int hexChars);
    static EndpointAddress addressFor(const QString& directory, const QString& name, const QString& suffix);

    QString m_handleName;
    QString m_handleDirectory;
    EndpointAddress m_main;
    EndpointAddress m_shared;
};
