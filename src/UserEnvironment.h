#pragma once

#include <QMap>
#include <QProcessEnvironment>
#include <QString>

#include "PreferencesManager.h"

class EndpointIdentity;

// The environment is read once at startup, optionally amended with the login
// shell's variables, and then handed to helper processes and launch requests.
class UserEnvironment {
public:
    static constexpr int SHELL_PROBE_TIMEOUT_MS = 10000;

    // Applications started from a desktop launcher (not a terminal) miss the login shell's PATH & co.
    static bool shouldProbeShell(PreferencesManager::Policy policy, const QProcessEnvironment& env);

    // Runs `$SHELL -ilc env`. Returns an empty environment and sets `error` on failure.
    static QProcessEnvironment probeShellEnvironment(const QString& shell, int timeoutMs, QString* error = nullptr);

    // Parses `env` output. Lines without '=' continue the previous value.
    static QProcessEnvironment parseEnvOutput(const QByteArray& output);

    // `base` overlaid with `shellEnv`; shell values win.
    static QProcessEnvironment merge(const QProcessEnvironment& base, const QProcessEnvironment& shellEnv);

    static QProcessEnvironment resolve(const QProcessEnvironment& base, bool probeShell);

    // Lets helper processes find their way back to the main instance.
    static void addIpcHooks(QProcessEnvironment& env, qint64 pid, const EndpointIdentity& identity);

    static QMap<QString, QString> toMap(const QProcessEnvironment& env);
};
