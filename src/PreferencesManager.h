#pragma once
#include <QObject>
#include <QSettings>
#include <QString>

// Application preferences. Built once by main() and passed to whoever needs it.
class PreferencesManager : public QObject {
    Q_OBJECT
public:
    explicit PreferencesManager(QObject* parent = nullptr);
    // Backed by an INI file instead of the platform store.
    explicit PreferencesManager(const QString& iniPath, QObject* parent = nullptr);
    ~PreferencesManager() override;

    QSettings& settings();

    enum LogLevel { Off = 0, Error = 1, Warning = 2, Info = 3, Debug = 4 };
    LogLevel logLevel() const;              // default Warning
    void setLogLevel(LogLevel lvl);
    QString logFile() const;                // default empty (no file)
    void setLogFile(const QString& path);

    enum class Policy { Auto = 0, Always = 1, Never = 2 };

    bool spawnSharedProcess() const;        // default true
    void setSpawnSharedProcess(bool enabled);
    Policy probeShellEnvironment() const;   // default Auto
    void setProbeShellEnvironment(Policy p);

    // Whether a refused connection may be treated as a stale handle. Auto = platform default.
    Policy staleHandleRetry() const;        // default Auto
    void setStaleHandleRetry(Policy p);
    bool staleHandleRetryEnabled(bool platformDefault) const;

    // Directory for socket handles; empty means the system temp directory.
    QString handleDirectory() const;
    void setHandleDirectory(const QString& path);

private:
    Policy policyValue(const char* key) const;

    QSettings m_settings;
};
