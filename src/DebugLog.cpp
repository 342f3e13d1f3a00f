#include "DebugLog.h"

#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QMutex>
#include <QMutexLocker>
#include <QtGlobal>
#include <atomic>
#include <cstdio>

static QFile* g_logFile = nullptr;
static QtMessageHandler g_oldHandler = nullptr;
static QMutex g_logMutex;
static std::atomic<bool> g_verbose{false};

static const char* levelTag(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg: return "DEBUG: ";
    case QtInfoMsg: return "INFO: ";
    case QtWarningMsg: return "WARN: ";
    case QtCriticalMsg: return "CRIT: ";
    case QtFatalMsg: return "FATAL: ";
    }
    return "";
}

static void writeStderr(const QString& msg)
{
    QByteArray localMsg = msg.toLocal8Bit();
    fwrite(localMsg.constData(), 1, localMsg.size(), stderr);
    fwrite("\n", 1, 1, stderr);
    fflush(stderr);
}

static void debugMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    QMutexLocker locker(&g_logMutex);
    const bool chatty = (type == QtDebugMsg || type == QtInfoMsg);

    if (g_logFile && g_logFile->isOpen()) {
        QTextStream ts(g_logFile);
        ts << QDateTime::currentDateTime().toString(Qt::ISODate) << " " << levelTag(type) << msg << "\n";
        ts.flush();
        // warnings and errors still reach the terminal
        if (!chatty || g_verbose.load()) writeStderr(msg);
        return;
    }

    // No log file: suppress debug/info to avoid console spam unless verbose; forward warnings/errors
    if (chatty && !g_verbose.load()) return;

    if (g_oldHandler) {
        g_oldHandler(type, context, msg);
    } else {
        writeStderr(msg);
    }
}

// Install a message handler at library load time to suppress debug/info to console
struct DebugLogInitializer {
    DebugLogInitializer() {
        g_oldHandler = qInstallMessageHandler(debugMessageHandler);
    }
};
static DebugLogInitializer s_debugLogInitializer;

void DebugLog::install(const QString& path)
{
    QMutexLocker locker(&g_logMutex);
    if (g_logFile) {
        // already enabled
        return;
    }
    if (!path.isEmpty()) {
        g_logFile = new QFile(path);
        if (!g_logFile->open(QIODevice::Append | QIODevice::Text)) {
            delete g_logFile;
            g_logFile = nullptr;
        }
    }
}

void DebugLog::uninstall()
{
    QMutexLocker locker(&g_logMutex);
    if (g_logFile) {
        g_logFile->close();
        delete g_logFile;
        g_logFile = nullptr;
    }
}

void DebugLog::setVerbose(bool verbose)
{
    g_verbose.store(verbose);
}

bool DebugLog::isVerbose()
{
    return g_verbose.load();
}

bool DebugLog::hasLogFile()
{
    QMutexLocker locker(&g_logMutex);
    return g_logFile != nullptr;
}
