#pragma once

#include <QString>
#include <memory>

class QLockFile;

// Secondary single-instance signal for external tools (installers, updaters).
// Never decides startup: the endpoint does. Failing to lock is only logged.
class InstanceLockHint {
public:
    explicit InstanceLockHint(const QString& lockPath);
    ~InstanceLockHint();

    bool tryAcquire(int timeoutMs = 100);
    bool isHeld() const { return m_held; }
    void release();

    QString path() const { return m_path; }

private:
    QString m_path;
    std::unique_ptr<QLockFile> m_lock;
    bool m_held = false;
};
