#include "WindowsManager.h"

#include <QDebug>

OpenRequest OpenRequest::fromArguments(const LaunchArguments& args, const QMap<QString, QString>& env)
{
    OpenRequest request;
    request.paths = args.paths;
    request.diffMode = args.diffMode;
    request.userEnvironment = env;
    if (args.openNewWindow && args.paths.isEmpty()) {
        // "-n" without paths: a new empty window
        request.forceNewWindow = true;
        request.forceEmpty = true;
    } else {
        request.forceNewWindow = args.openNewWindow && !args.reuseWindow;
    }
    return request;
}

bool WindowLaunchService::start(const LaunchRequest& request, QString* error)
{
    const LaunchArguments args = CommandLine::parse(request.arguments);
    if (args.sharedProcess) {
        if (error) *error = QStringLiteral("--shared-process cannot be forwarded");
        return false;
    }
    for (const QString& w : args.warnings) {
        qWarning() << "Launch: forwarded command line:" << w;
    }
    qInfo() << "Launch: received request from second instance" << request.arguments;
    m_windows.open(OpenRequest::fromArguments(args, request.environment));
    return true;
}
