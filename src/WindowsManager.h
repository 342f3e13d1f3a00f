#pragma once

#include <QMap>
#include <QString>
#include <QStringList>

#include "CommandLine.h"
#include "LaunchChannel.h"

struct OpenRequest {
    QStringList paths;
    bool forceNewWindow = false;
    bool forceEmpty = false;
    bool diffMode = false;
    QMap<QString, QString> userEnvironment;

    // Window to open for a command line, either our own or a forwarded one.
    static OpenRequest fromArguments(const LaunchArguments& args, const QMap<QString, QString>& env);
};

// The "open window" capability the running instance exposes to launches.
class WindowsManager {
public:
    virtual ~WindowsManager() = default;
    virtual void open(const OpenRequest& request) = 0;
    virtual int windowCount() const = 0;
};

// Turns forwarded launches into windows.
class WindowLaunchService : public LaunchService {
public:
    explicit WindowLaunchService(WindowsManager& windows) : m_windows(windows) {}
    bool start(const LaunchRequest& request, QString* error) override;

private:
    WindowsManager& m_windows;
};
