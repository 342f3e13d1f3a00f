#pragma once

#include <QObject>
#include <atomic>
#include <functional>
#include <memory>

class IpcServer;
class SharedProcess;
class InstanceLockHint;
class QCoreApplication;

/**
 * LifecycleGuard: owns what the running instance must release on the way out.
 *
 * dispose() releases the bound server, the shared helper process and the lock
 * hint exactly once, whichever shutdown path gets there first:
 *  - QCoreApplication::aboutToQuit        (clean, exit code unchanged)
 *  - shutdown(code), e.g. the lifecycle channel's "exit" or SIGTERM
 *  - handleFault(message), uncaught exceptions and std::terminate (exit code 1)
 */
class LifecycleGuard : public QObject
{
    Q_OBJECT

public:
    using ExitHandler = std::function<void(int exitCode)>;

    // Default exit handler: QCoreApplication::exit(code).
    explicit LifecycleGuard(ExitHandler exitHandler = ExitHandler(), QObject* parent = nullptr);
    ~LifecycleGuard() override;

    void adoptServer(std::unique_ptr<IpcServer> server);
    void adoptSharedProcess(std::unique_ptr<SharedProcess> process);
    void adoptLockHint(std::unique_ptr<InstanceLockHint> hint);

    IpcServer* server() const { return m_server.get(); }
    SharedProcess* sharedProcess() const { return m_sharedProcess.get(); }
    InstanceLockHint* lockHint() const { return m_lockHint.get(); }

    // Returns true only for the call that actually released the resources.
    bool dispose();
    bool isDisposed() const { return m_disposed.load(); }

    void shutdown(int exitCode);
    void handleFault(const QString& message);

    void watchApplication(QCoreApplication* app);

    // Routes std::terminate through handleFault() on `guard`, then exits with 1.
    static void installTerminateHandler(LifecycleGuard* guard);

private:
    ExitHandler m_exitHandler;
    std::unique_ptr<IpcServer> m_server;
    std::unique_ptr<SharedProcess> m_sharedProcess;
    std::unique_ptr<InstanceLockHint> m_lockHint;
    std::atomic<bool> m_disposed{false};
};
