#include "HandleCleaner.h"

#include <QFile>
#include <QDebug>

#ifdef Q_OS_UNIX
#include <unistd.h>
#include <cerrno>
#include <cstring>
#endif

CleanupResult FileHandleCleaner::removeStaleHandle(const EndpointAddress& address)
{
#ifdef Q_OS_UNIX
    const QByteArray path = QFile::encodeName(address.path);
    if (::unlink(path.constData()) == 0) {
        qInfo() << "SingleInstance: removed stale handle" << address.path;
        return CleanupResult::removed(true);
    }
    const int err = errno;
    if (err == ENOENT) {
        return CleanupResult::removed(false);
    }
    return CleanupResult::failed(QStringLiteral("cannot remove %1: %2")
                                     .arg(address.path, QString::fromLocal8Bit(strerror(err))));
#else
    // Named pipes vanish with their last handle; there is nothing to delete.
    Q_UNUSED(address);
    return CleanupResult::removed(false);
#endif
}
