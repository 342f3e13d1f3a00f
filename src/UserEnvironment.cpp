#include "UserEnvironment.h"
#include "EndpointIdentity.h"

#include <QProcess>
#include <QDebug>

bool UserEnvironment::shouldProbeShell(PreferencesManager::Policy policy, const QProcessEnvironment& env)
{
    switch (policy) {
    case PreferencesManager::Policy::Always: return true;
    case PreferencesManager::Policy::Never: return false;
    case PreferencesManager::Policy::Auto: break;
    }
#ifdef Q_OS_MACOS
    // TERM_PROGRAM is only set when launched from a terminal
    return !env.contains(QStringLiteral("TERM_PROGRAM")) && !env.contains(QStringLiteral("LODESTAR_CLI"));
#else
    Q_UNUSED(env);
    return false;
#endif
}

QProcessEnvironment UserEnvironment::probeShellEnvironment(const QString& shell, int timeoutMs, QString* error)
{
    if (shell.isEmpty()) {
        if (error) *error = QStringLiteral("no shell configured");
        return QProcessEnvironment();
    }

    QProcess proc;
    proc.setProgram(shell);
    proc.setArguments({QStringLiteral("-ilc"), QStringLiteral("command env")});
    proc.setStandardInputFile(QProcess::nullDevice());
    proc.start();
    if (!proc.waitForStarted(timeoutMs)) {
        if (error) *error = QStringLiteral("cannot start %1: %2").arg(shell, proc.errorString());
        return QProcessEnvironment();
    }
    if (!proc.waitForFinished(timeoutMs)) {
        proc.kill();
        proc.waitForFinished(1000);
        if (error) *error = QStringLiteral("%1 did not finish within %2 ms").arg(shell).arg(timeoutMs);
        return QProcessEnvironment();
    }
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        if (error) *error = QStringLiteral("%1 exited with code %2").arg(shell).arg(proc.exitCode());
        return QProcessEnvironment();
    }
    return parseEnvOutput(proc.readAllStandardOutput());
}

QProcessEnvironment UserEnvironment::parseEnvOutput(const QByteArray& output)
{
    QProcessEnvironment env;
    QString lastKey;
    const QList<QByteArray> lines = output.split('\n');
    for (const QByteArray& raw : lines) {
        const QString line = QString::fromLocal8Bit(raw);
        const int eq = line.indexOf(QLatin1Char('='));
        if (eq > 0 && !line.left(eq).contains(QLatin1Char(' '))) {
            lastKey = line.left(eq);
            env.insert(lastKey, line.mid(eq + 1));
        } else if (!lastKey.isEmpty() && !raw.isEmpty()) {
            env.insert(lastKey, env.value(lastKey) + QLatin1Char('\n') + line);
        }
    }
    return env;
}

QProcessEnvironment UserEnvironment::merge(const QProcessEnvironment& base, const QProcessEnvironment& shellEnv)
{
    QProcessEnvironment out = base;
    const QStringList keys = shellEnv.keys();
    for (const QString& key : keys) {
        out.insert(key, shellEnv.value(key));
    }
    return out;
}

QProcessEnvironment UserEnvironment::resolve(const QProcessEnvironment& base, bool probeShell)
{
    if (!probeShell) return base;

    const QString shell = base.value(QStringLiteral("SHELL"), QStringLiteral("/bin/sh"));
    QString error;
    const QProcessEnvironment shellEnv = probeShellEnvironment(shell, SHELL_PROBE_TIMEOUT_MS, &error);
    if (!error.isEmpty()) {
        qWarning() << "Environment: ignoring shell environment:" << error;
        return base;
    }
    qInfo() << "Environment: merged" << shellEnv.keys().size() << "variables from" << shell;
    return merge(base, shellEnv);
}

void UserEnvironment::addIpcHooks(QProcessEnvironment& env, qint64 pid, const EndpointIdentity& identity)
{
    env.insert(QStringLiteral("LODESTAR_PID"), QString::number(pid));
    env.insert(QStringLiteral("LODESTAR_IPC_HOOK"), identity.mainAddress().path);
    env.insert(QStringLiteral("LODESTAR_SHARED_IPC_HOOK"), identity.sharedAddress().path);
}

QMap<QString, QString> UserEnvironment::toMap(const QProcessEnvironment& env)
{
    QMap<QString, QString> out;
    const QStringList keys = env.keys();
    for (const QString& key : keys) {
        out.insert(key, env.value(key));
    }
    return out;
}
