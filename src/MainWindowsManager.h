#pragma once

#include <QObject>
#include <QList>
#include <QPointer>

#include "WindowsManager.h"

class MainWindow;

class MainWindowsManager : public QObject, public WindowsManager
{
    Q_OBJECT
public:
    explicit MainWindowsManager(QObject* parent = nullptr);
    ~MainWindowsManager() override;

    void open(const OpenRequest& request) override;
    int windowCount() const override;

private:
    MainWindow* lastActiveWindow() const;
    MainWindow* createWindow();

    QList<QPointer<MainWindow>> m_windows;
};
