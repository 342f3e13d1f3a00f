#pragma once

#include <QString>
#include <QStringList>

struct LaunchArguments {
    QStringList rawArguments;     // as given, without the program name
    QStringList paths;
    bool openNewWindow = false;
    bool reuseWindow = false;
    bool diffMode = false;        // only when exactly two paths were given
    bool verbose = false;
    bool sharedProcess = false;
    QString extensionTestsPath;
    QString logFile;
    QStringList warnings;

    // Automated test runs must own the endpoint themselves.
    bool isTestingFromCli() const { return !extensionTestsPath.isEmpty(); }
};

class CommandLine {
public:
    // `arguments` excludes the program name. Unknown options end up in `warnings`.
    static LaunchArguments parse(const QStringList& arguments);
};
