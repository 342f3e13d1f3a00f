#pragma once

#include <QObject>
#include <QProcessEnvironment>
#include <QStringList>
#include <memory>

#include "EndpointIdentity.h"
#include "IpcChannel.h"

class QProcess;
class QSocketNotifier;
class IpcServer;
class HandleCleaner;

// Helper process spawned by the main instance; lives as long as the main instance does.
class SharedProcess : public QObject
{
    Q_OBJECT

public:
    static constexpr int TERMINATE_TIMEOUT_MS = 2000;

    SharedProcess(const QString& program, const QStringList& arguments,
                  const QProcessEnvironment& env, QObject* parent = nullptr);
    ~SharedProcess() override;

    bool spawn(QString* error = nullptr);
    bool isRunning() const;
    qint64 processId() const;

    // Terminates the helper, kills it after TERMINATE_TIMEOUT_MS. Safe to call repeatedly.
    void dispose();
    bool isDisposed() const { return m_disposed; }

signals:
    void exitedUnexpectedly(int exitCode);

private:
    QString m_program;
    QStringList m_arguments;
    QProcessEnvironment m_env;
    QProcess* m_process = nullptr;
    bool m_disposed = false;
};

class SharedChannel : public IpcChannel {
public:
    static constexpr const char* NAME = "shared";
    IpcReply call(const QString& command, const QJsonValue& arg) override;
};

// Runs inside the helper: serves the shared endpoint until the parent goes away.
class SharedProcessHost : public QObject
{
    Q_OBJECT

public:
    SharedProcessHost(const EndpointAddress& address, HandleCleaner& cleaner, QObject* parent = nullptr);
    ~SharedProcessHost() override;

    bool start(QString* error = nullptr);
    // Stdin reaching EOF means the parent died; emits parentGone().
    void watchParent(int fd);

signals:
    void parentGone();

private:
    EndpointAddress m_address;
    HandleCleaner& m_cleaner;
    std::unique_ptr<IpcServer> m_server;
    QSocketNotifier* m_notifier = nullptr;
};
