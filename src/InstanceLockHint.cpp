#include "InstanceLockHint.h"

#include <QLockFile>
#include <QDebug>

InstanceLockHint::InstanceLockHint(const QString& lockPath)
    : m_path(lockPath)
    , m_lock(new QLockFile(lockPath))
{
    m_lock->setStaleLockTime(30000);
}

InstanceLockHint::~InstanceLockHint()
{
    release();
}

bool InstanceLockHint::tryAcquire(int timeoutMs)
{
    if (m_held) return true;
    if (m_lock->tryLock(timeoutMs)) {
        m_held = true;
        return true;
    }
    // A crashed owner leaves its lock behind; QLockFile can tell by the recorded pid.
    if (m_lock->error() == QLockFile::LockFailedError && m_lock->removeStaleLockFile() && m_lock->tryLock(0)) {
        qInfo() << "SingleInstance: took over stale lock" << m_path;
        m_held = true;
        return true;
    }
    qWarning() << "SingleInstance: could not take lock hint" << m_path << "error" << static_cast<int>(m_lock->error());
    return false;
}

void InstanceLockHint::release()
{
    if (!m_held) return;
    m_lock->unlock();
    m_held = false;
}
