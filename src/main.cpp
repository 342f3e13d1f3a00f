#include <QCoreApplication>
#include <QProcessEnvironment>
#include <QTimer>
#include <QDebug>
#include <csignal>
#include <cstdlib>
#include <memory>

#include "AskpassChannel.h"
#include "BootstrapOrchestrator.h"
#include "CommandLine.h"
#include "DebugLog.h"
#include "DialogCredentialPrompt.h"
#include "EndpointIdentity.h"
#include "HandleCleaner.h"
#include "InstanceBinder.h"
#include "InstanceLockHint.h"
#include "LaunchChannel.h"
#include "LaunchForwarder.h"
#include "LifecycleChannel.h"
#include "LifecycleGuard.h"
#include "LodestarApplication.h"
#include "MainWindowsManager.h"
#include "PlatformIntegration.h"
#include "PreferencesManager.h"
#include "SharedProcess.h"
#include "UnixSignalWatcher.h"
#include "UserEnvironment.h"

static const QString PRODUCT_NAME = QStringLiteral("lodestar");

static void setupLogging(const LaunchArguments& args, const PreferencesManager& prefs)
{
    // LODESTAR_DEBUG_LOG_PATH wins over --log-file, which wins over the preference
    const char* dbgPath = getenv("LODESTAR_DEBUG_LOG_PATH");
    if (dbgPath && dbgPath[0] != '\0') {
        DebugLog::install(QString::fromUtf8(dbgPath));
    } else if (!args.logFile.isEmpty()) {
        DebugLog::install(args.logFile);
    } else if (!prefs.logFile().isEmpty()) {
        DebugLog::install(prefs.logFile());
    }
    DebugLog::setVerbose(args.verbose || prefs.logLevel() >= PreferencesManager::Info);
}

static EndpointIdentity deriveIdentity(const PreferencesManager& prefs, const QProcessEnvironment& env)
{
    return EndpointIdentity::derive(PRODUCT_NAME,
                                    EndpointIdentity::currentUserName(env),
                                    prefs.handleDirectory(),
                                    !env.contains(QStringLiteral("LODESTAR_DEV")));
}

static int runSharedProcess(int argc, char** argv, const LaunchArguments& args)
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName(PRODUCT_NAME);
    app.setApplicationName(PRODUCT_NAME);

    PreferencesManager prefs;
    setupLogging(args, prefs);

    const EndpointIdentity identity = deriveIdentity(prefs, QProcessEnvironment::systemEnvironment());
    FileHandleCleaner cleaner;
    SharedProcessHost host(identity.sharedAddress(), cleaner);
    QString error;
    if (!host.start(&error)) {
        qCritical().noquote() << "SharedProcess: cannot start:" << error;
        return 1;
    }
    host.watchParent(0);
    QObject::connect(&host, &SharedProcessHost::parentGone, &app, []() { QCoreApplication::exit(0); });
    return app.exec();
}

int main(int argc, char** argv)
{
    QStringList rawArgs;
    for (int i = 1; i < argc; ++i) rawArgs.append(QString::fromLocal8Bit(argv[i]));
    const LaunchArguments args = CommandLine::parse(rawArgs);

    if (args.sharedProcess) {
        return runSharedProcess(argc, argv, args);
    }

    LodestarApplication app(argc, argv);
    app.setOrganizationName(PRODUCT_NAME);
    app.setApplicationName(PRODUCT_NAME);

    PreferencesManager prefs;
    setupLogging(args, prefs);
    for (const QString& w : args.warnings) qWarning() << "main:" << w;

    // The environment is read once; everything below sees this snapshot.
    const QProcessEnvironment processEnv = QProcessEnvironment::systemEnvironment();
    const QProcessEnvironment userEnv = UserEnvironment::resolve(
        processEnv, UserEnvironment::shouldProbeShell(prefs.probeShellEnvironment(), processEnv));

    const bool isBuilt = !processEnv.contains(QStringLiteral("LODESTAR_DEV"));
    app.setDesktopFileName(DesktopPlatformIntegration::appUserModelId(PRODUCT_NAME, isBuilt));

    const EndpointIdentity identity = deriveIdentity(prefs, processEnv);
    const LaunchRequest request = LaunchRequest::fromProcess(rawArgs, userEnv);
    qInfo() << "main: starting single-instance check on" << identity.mainAddress().path;

    LocalInstanceBinder binder;
    LocalLaunchForwarder forwarder(args.isTestingFromCli());
    FileHandleCleaner cleaner;
    DesktopPlatformIntegration platform(
        prefs.staleHandleRetryEnabled(DesktopPlatformIntegration::defaultStaleHandlesPossible()));
    BootstrapOrchestrator bootstrap(identity.mainAddress(), request, binder, forwarder, cleaner, platform);

    LifecycleGuard guard;
    app.setLifecycleGuard(&guard);
    LifecycleGuard::installTerminateHandler(&guard);

    MainWindowsManager windows;
    WindowLaunchService launchService(windows);
    DialogCredentialPrompt credentialPrompt;
    UnixSignalWatcher signalWatcher;

    QObject::connect(&bootstrap, &BootstrapOrchestrator::finished, &app, [&](const StartupOutcome& outcome) {
        if (outcome.kind != StartupOutcome::Kind::Bound) {
            // hand-off exits 0, everything else 1; nothing was started yet
            QCoreApplication::exit(outcome.exitCode());
            return;
        }

        std::unique_ptr<IpcServer> server = bootstrap.takeServer();
        server->registerChannel(QString::fromLatin1(LaunchChannel::NAME), std::make_unique<LaunchChannel>(launchService));
        server->registerChannel(QString::fromLatin1(AskpassChannel::NAME), std::make_unique<AskpassChannel>(credentialPrompt));
        server->registerChannel(QString::fromLatin1(LifecycleChannel::NAME),
                                std::make_unique<LifecycleChannel>([&guard](int code) { guard.shutdown(code); }));
        server->setReady();
        guard.adoptServer(std::move(server));

        auto lockHint = std::make_unique<InstanceLockHint>(identity.lockFilePath());
        lockHint->tryAcquire();
        guard.adoptLockHint(std::move(lockHint));

        QProcessEnvironment helperEnv = userEnv;
        UserEnvironment::addIpcHooks(helperEnv, QCoreApplication::applicationPid(), identity);
        if (prefs.spawnSharedProcess()) {
            QStringList helperArgs{QStringLiteral("--shared-process")};
            if (args.verbose) helperArgs.append(QStringLiteral("--verbose"));
            auto shared = std::make_unique<SharedProcess>(QCoreApplication::applicationFilePath(), helperArgs, helperEnv);
            QString error;
            if (shared->spawn(&error)) {
                guard.adoptSharedProcess(std::move(shared));
            } else {
                qWarning().noquote() << "main: shared process not available:" << error;
            }
        }

        guard.watchApplication(&app);
#ifdef Q_OS_UNIX
        QString signalError;
        if (signalWatcher.watch({SIGTERM, SIGINT, SIGHUP}, &signalError)) {
            QObject::connect(&signalWatcher, &UnixSignalWatcher::signalReceived, &guard, [&guard](int) { guard.shutdown(0); });
        } else {
            qWarning().noquote() << "main:" << signalError;
        }
#endif

        windows.open(OpenRequest::fromArguments(args, UserEnvironment::toMap(userEnv)));
    });

    QTimer::singleShot(0, &bootstrap, &BootstrapOrchestrator::start);
    const int code = app.exec();
    guard.dispose();
    return code;
}
