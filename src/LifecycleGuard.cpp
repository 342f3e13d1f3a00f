#include "LifecycleGuard.h"
#include "InstanceLockHint.h"
#include "IpcServer.h"
#include "SharedProcess.h"

#include <QCoreApplication>
#include <QDebug>
#include <cstdlib>
#include <exception>

static std::atomic<LifecycleGuard*> s_terminateGuard{nullptr};

LifecycleGuard::LifecycleGuard(ExitHandler exitHandler, QObject* parent)
    : QObject(parent)
    , m_exitHandler(std::move(exitHandler))
{
    if (!m_exitHandler) {
        m_exitHandler = [](int code) { QCoreApplication::exit(code); };
    }
}

LifecycleGuard::~LifecycleGuard()
{
    LifecycleGuard* self = this;
    s_terminateGuard.compare_exchange_strong(self, nullptr);
    dispose();
}

void LifecycleGuard::adoptServer(std::unique_ptr<IpcServer> server)
{
    if (m_disposed.load()) {
        if (server) server->dispose();
        return;
    }
    m_server = std::move(server);
}

void LifecycleGuard::adoptSharedProcess(std::unique_ptr<SharedProcess> process)
{
    if (m_disposed.load()) {
        if (process) process->dispose();
        return;
    }
    m_sharedProcess = std::move(process);
}

void LifecycleGuard::adoptLockHint(std::unique_ptr<InstanceLockHint> hint)
{
    if (m_disposed.load()) {
        if (hint) hint->release();
        return;
    }
    m_lockHint = std::move(hint);
}

bool LifecycleGuard::dispose()
{
    if (m_disposed.exchange(true)) return false;

    if (m_server) {
        m_server->dispose();
        // a channel handler may still be on the stack
        m_server.release()->deleteLater();
    }
    if (m_sharedProcess) {
        m_sharedProcess->dispose();
    }
    if (m_lockHint) {
        m_lockHint->release();
    }
    return true;
}

void LifecycleGuard::shutdown(int exitCode)
{
    qInfo() << "Lifecycle: shutting down with code" << exitCode;
    dispose();
    m_exitHandler(exitCode);
}

void LifecycleGuard::handleFault(const QString& message)
{
    qCritical().noquote() << "[uncaught exception in main]:" << message;
    dispose();
    m_exitHandler(1);
}

void LifecycleGuard::watchApplication(QCoreApplication* app)
{
    connect(app, &QCoreApplication::aboutToQuit, this, [this]() {
        qInfo() << "Lifecycle: about to quit, disposing resources";
        dispose();
    });
}

static QString describeCurrentException()
{
    std::exception_ptr current = std::current_exception();
    if (!current) return QStringLiteral("std::terminate called without an active exception");
    try {
        std::rethrow_exception(current);
    } catch (const std::exception& e) {
        return QString::fromLocal8Bit(e.what());
    } catch (...) {
        return QStringLiteral("unknown exception");
    }
}

void LifecycleGuard::installTerminateHandler(LifecycleGuard* guard)
{
    s_terminateGuard.store(guard);
    std::set_terminate([]() {
        const QString message = describeCurrentException();
        if (LifecycleGuard* g = s_terminateGuard.load()) {
            g->handleFault(message);
        } else {
            qCritical().noquote() << "[uncaught exception in main]:" << message;
        }
        std::_Exit(1);
    });
}
