#include "SharedProcess.h"
#include "HandleCleaner.h"
#include "IpcServer.h"

#include <QCoreApplication>
#include <QProcess>
#include <QSocketNotifier>
#include <QDebug>

#ifdef Q_OS_UNIX
#include <unistd.h>
#include <cerrno>
#endif

SharedProcess::SharedProcess(const QString& program, const QStringList& arguments,
                             const QProcessEnvironment& env, QObject* parent)
    : QObject(parent)
    , m_program(program)
    , m_arguments(arguments)
    , m_env(env)
{
}

SharedProcess::~SharedProcess()
{
    dispose();
}

bool SharedProcess::spawn(QString* error)
{
    if (m_disposed || m_process) {
        if (error) *error = QStringLiteral("shared process already spawned or disposed");
        return false;
    }

    m_process = new QProcess(this);
    m_process->setProgram(m_program);
    m_process->setArguments(m_arguments);
    m_process->setProcessEnvironment(m_env);
    // stdout/stderr go to our terminal; stdin stays a pipe so the helper sees EOF when we die
    m_process->setProcessChannelMode(QProcess::ForwardedChannels);

    connect(m_process, &QProcess::finished, this, [this](int exitCode, QProcess::ExitStatus) {
        if (m_disposed) return;
        qWarning() << "SharedProcess: helper exited unexpectedly with code" << exitCode;
        emit exitedUnexpectedly(exitCode);
    });

    m_process->start();
    if (!m_process->waitForStarted(5000)) {
        if (error) *error = QStringLiteral("cannot start %1: %2").arg(m_program, m_process->errorString());
        delete m_process;
        m_process = nullptr;
        return false;
    }
    qInfo() << "SharedProcess: started pid" << m_process->processId();
    return true;
}

bool SharedProcess::isRunning() const
{
    return m_process && m_process->state() != QProcess::NotRunning;
}

qint64 SharedProcess::processId() const
{
    return m_process ? m_process->processId() : 0;
}

void SharedProcess::dispose()
{
    if (m_disposed) return;
    m_disposed = true;
    if (!m_process) return;

    if (m_process->state() != QProcess::NotRunning) {
        m_process->closeWriteChannel();
        m_process->terminate();
        if (!m_process->waitForFinished(TERMINATE_TIMEOUT_MS)) {
            qWarning() << "SharedProcess: helper did not terminate, killing";
            m_process->kill();
            m_process->waitForFinished(TERMINATE_TIMEOUT_MS);
        }
    }
}

IpcReply SharedChannel::call(const QString& command, const QJsonValue& arg)
{
    Q_UNUSED(arg);
    if (command == QLatin1String("ping")) {
        return IpcReply::success(QCoreApplication::applicationPid());
    }
    return IpcReply::failure(QStringLiteral("shared: unknown command %1").arg(command));
}

SharedProcessHost::SharedProcessHost(const EndpointAddress& address, HandleCleaner& cleaner, QObject* parent)
    : QObject(parent)
    , m_address(address)
    , m_cleaner(cleaner)
{
}

SharedProcessHost::~SharedProcessHost()
{
    if (m_server) m_server->dispose();
}

bool SharedProcessHost::start(QString* error)
{
    // Only the main instance spawns us, so anything at this address is left over.
    const CleanupResult cleanup = m_cleaner.removeStaleHandle(m_address);
    if (cleanup.status != CleanupResult::Status::Removed) {
        if (error) *error = cleanup.error;
        return false;
    }

    auto server = std::make_unique<IpcServer>();
    QString listenError;
    if (server->listen(m_address, &listenError) != IpcServer::ListenStatus::Listening) {
        if (error) *error = QStringLiteral("cannot listen on %1: %2").arg(m_address.path, listenError);
        return false;
    }
    server->registerChannel(QString::fromLatin1(SharedChannel::NAME), std::make_unique<SharedChannel>());
    server->setReady();
    m_server = std::move(server);
    qInfo() << "SharedProcess: serving" << m_address.path;
    return true;
}

void SharedProcessHost::watchParent(int fd)
{
#ifdef Q_OS_UNIX
    if (m_notifier) return;
    m_notifier = new QSocketNotifier(fd, QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, [this, fd]() {
        char buf[256];
        const ssize_t r = ::read(fd, buf, sizeof(buf));
        if (r > 0 || (r < 0 && (errno == EINTR || errno == EAGAIN))) return;
        m_notifier->setEnabled(false);
        qInfo() << "SharedProcess: parent went away";
        emit parentGone();
    });
#else
    Q_UNUSED(fd);
#endif
}
