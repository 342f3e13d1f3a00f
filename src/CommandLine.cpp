#include "CommandLine.h"

#include <QCommandLineParser>
#include <QCommandLineOption>

LaunchArguments CommandLine::parse(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);

    const QCommandLineOption newWindow({"n", "new-window"}, "Force a new window.");
    const QCommandLineOption reuseWindow({"r", "reuse-window"}, "Open in the last active window.");
    const QCommandLineOption diff({"d", "diff"}, "Open a diff editor for two files.");
    const QCommandLineOption tests("extensionTestsPath", "Run automated tests from <path>.", "path");
    const QCommandLineOption verbose("verbose", "Print info and debug messages.");
    const QCommandLineOption logFile("log-file", "Append log output to <file>.", "file");
    QCommandLineOption shared("shared-process", "Run as the shared helper process.");
    shared.setFlags(QCommandLineOption::HiddenFromHelp);

    parser.addOptions({newWindow, reuseWindow, diff, tests, verbose, logFile, shared});
    parser.addPositionalArgument("paths", "Files or folders to open.", "[paths...]");

    LaunchArguments out;
    out.rawArguments = arguments;

    QStringList withProgram = arguments;
    withProgram.prepend(QStringLiteral("lodestar"));
    if (!parser.parse(withProgram)) {
        // keep going: an unknown flag from a newer launcher must not block startup
        out.warnings.append(parser.errorText());
    }

    out.paths = parser.positionalArguments();
    out.openNewWindow = parser.isSet(newWindow);
    out.reuseWindow = parser.isSet(reuseWindow);
    out.diffMode = parser.isSet(diff) && out.paths.size() == 2;
    out.verbose = parser.isSet(verbose);
    out.sharedProcess = parser.isSet(shared);
    out.extensionTestsPath = parser.value(tests);
    out.logFile = parser.value(logFile);
    return out;
}
