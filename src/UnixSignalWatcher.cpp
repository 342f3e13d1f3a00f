#include "UnixSignalWatcher.h"

#include <QSocketNotifier>
#include <QDebug>

#ifdef Q_OS_UNIX
#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <cstring>

static int s_signalFds[2] = {-1, -1};

static void writeSignal(int signalNumber)
{
    const int savedErrno = errno;
    const unsigned char b = static_cast<unsigned char>(signalNumber);
    ssize_t ignored = ::write(s_signalFds[0], &b, 1);
    (void)ignored;
    errno = savedErrno;
}
#endif

UnixSignalWatcher::UnixSignalWatcher(QObject* parent)
    : QObject(parent)
{
}

UnixSignalWatcher::~UnixSignalWatcher()
{
#ifdef Q_OS_UNIX
    for (int sig : m_watched) {
        ::signal(sig, SIG_DFL);
    }
#endif
}

bool UnixSignalWatcher::watch(const QList<int>& signalNumbers, QString* error)
{
#ifdef Q_OS_UNIX
    if (s_signalFds[0] == -1) {
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_signalFds) != 0) {
            if (error) *error = QStringLiteral("socketpair: %1").arg(QString::fromLocal8Bit(strerror(errno)));
            return false;
        }
        for (int fd : s_signalFds) {
            ::fcntl(fd, F_SETFD, FD_CLOEXEC);
            ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
        }
    }

    if (!m_notifier) {
        m_notifier = new QSocketNotifier(s_signalFds[1], QSocketNotifier::Read, this);
        connect(m_notifier, &QSocketNotifier::activated, this, [this]() {
            unsigned char b = 0;
            while (::read(s_signalFds[1], &b, 1) == 1) {
                qInfo() << "Lifecycle: received signal" << static_cast<int>(b);
                emit signalReceived(static_cast<int>(b));
            }
        });
    }

    for (int sig : signalNumbers) {
        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = writeSignal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;
        if (::sigaction(sig, &sa, nullptr) != 0) {
            if (error) *error = QStringLiteral("sigaction(%1): %2").arg(sig).arg(QString::fromLocal8Bit(strerror(errno)));
            return false;
        }
        if (!m_watched.contains(sig)) m_watched.append(sig);
    }
    return true;
#else
    Q_UNUSED(signalNumbers);
    if (error) *error = QStringLiteral("signal watching is only available on Unix");
    return false;
#endif
}
