#include "MainWindowsManager.h"
#include "MainWindow.h"

#include <QApplication>
#include <QMetaObject>
#include <QDebug>

MainWindowsManager::MainWindowsManager(QObject* parent)
    : QObject(parent)
{
}

MainWindowsManager::~MainWindowsManager()
{
    for (const QPointer<MainWindow>& w : m_windows) {
        if (w) delete w.data();
    }
}

void MainWindowsManager::open(const OpenRequest& request)
{
    MainWindow* window = request.forceNewWindow ? nullptr : lastActiveWindow();
    const bool reused = window != nullptr;
    if (!window) window = createWindow();

    window->setUserEnvironment(request.userEnvironment);
    if (!request.forceEmpty) window->openPaths(request.paths, request.diffMode);

    if (reused) {
        qInfo() << "Windows: raising existing window";
        QMetaObject::invokeMethod(window, "raise", Qt::QueuedConnection);
        QMetaObject::invokeMethod(window, "activateWindow", Qt::QueuedConnection);
    } else {
        window->show();
    }
}

int MainWindowsManager::windowCount() const
{
    int n = 0;
    for (const QPointer<MainWindow>& w : m_windows) {
        if (w) ++n;
    }
    return n;
}

MainWindow* MainWindowsManager::lastActiveWindow() const
{
    if (auto* active = qobject_cast<MainWindow*>(QApplication::activeWindow())) return active;
    for (int i = m_windows.size() - 1; i >= 0; --i) {
        if (m_windows[i]) return m_windows[i];
    }
    return nullptr;
}

MainWindow* MainWindowsManager::createWindow()
{
    auto* window = new MainWindow();
    window->setAttribute(Qt::WA_DeleteOnClose);
    m_windows.removeAll(QPointer<MainWindow>());
    m_windows.append(window);
    return window;
}
