#pragma once

#include <QMainWindow>
#include <QMap>
#include <QString>
#include <QStringList>

class QListWidget;
class QLabel;

/**
 * Main application window. Lists the paths opened in it; a diff launch shows
 * the two compared files side by side in the status line.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    void openPaths(const QStringList& paths, bool diffMode);
    void setUserEnvironment(const QMap<QString, QString>& env) { m_userEnvironment = env; }

    QStringList openedPaths() const { return m_paths; }
    QMap<QString, QString> userEnvironment() const { return m_userEnvironment; }

private:
    QListWidget* m_list = nullptr;
    QLabel* m_status = nullptr;
    QStringList m_paths;
    QMap<QString, QString> m_userEnvironment;
};
