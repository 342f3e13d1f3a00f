#include "PreferencesManager.h"
#include <QDir>

PreferencesManager::PreferencesManager(QObject* parent)
    : QObject(parent)
    , m_settings("lodestar", "lodestar") // org, app
{
}

PreferencesManager::PreferencesManager(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
}

PreferencesManager::~PreferencesManager() = default;

QSettings& PreferencesManager::settings() {
    return m_settings;
}

PreferencesManager::LogLevel PreferencesManager::logLevel() const {
    int v = m_settings.value("debug/logLevel", static_cast<int>(Warning)).toInt();
    if (v < Off || v > Debug) v = Warning;
    return static_cast<LogLevel>(v);
}

void PreferencesManager::setLogLevel(LogLevel lvl) {
    m_settings.setValue("debug/logLevel", static_cast<int>(lvl));
}

QString PreferencesManager::logFile() const {
    return m_settings.value("debug/logFile").toString().trimmed();
}

void PreferencesManager::setLogFile(const QString& path) {
    m_settings.setValue("debug/logFile", path.trimmed());
}

bool PreferencesManager::spawnSharedProcess() const {
    return m_settings.value("startup/spawnSharedProcess", true).toBool();
}

void PreferencesManager::setSpawnSharedProcess(bool enabled) {
    m_settings.setValue("startup/spawnSharedProcess", enabled);
}

PreferencesManager::Policy PreferencesManager::probeShellEnvironment() const {
    return policyValue("startup/probeShellEnvironment");
}

void PreferencesManager::setProbeShellEnvironment(Policy p) {
    m_settings.setValue("startup/probeShellEnvironment", static_cast<int>(p));
}

PreferencesManager::Policy PreferencesManager::staleHandleRetry() const {
    return policyValue("ipc/staleHandleRetry");
}

void PreferencesManager::setStaleHandleRetry(Policy p) {
    m_settings.setValue("ipc/staleHandleRetry", static_cast<int>(p));
}

bool PreferencesManager::staleHandleRetryEnabled(bool platformDefault) const {
    switch (staleHandleRetry()) {
    case Policy::Always: return true;
    case Policy::Never: return false;
    case Policy::Auto: break;
    }
    return platformDefault;
}

QString PreferencesManager::handleDirectory() const {
    const QString dir = m_settings.value("ipc/handleDirectory").toString().trimmed();
    return dir.isEmpty() ? QString() : QDir::cleanPath(dir);
}

void PreferencesManager::setHandleDirectory(const QString& path) {
    m_settings.setValue("ipc/handleDirectory", path.trimmed());
}

PreferencesManager::Policy PreferencesManager::policyValue(const char* key) const {
    int v = m_settings.value(key, static_cast<int>(Policy::Auto)).toInt();
    if (v < static_cast<int>(Policy::Auto) || v > static_cast<int>(Policy::Never)) v = static_cast<int>(Policy::Auto);
    return static_cast<Policy>(v);
}
