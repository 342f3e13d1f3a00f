#include "MainWindow.h"

#include <QListWidget>
#include <QLabel>
#include <QStatusBar>
#include <QFileInfo>
#include <QDebug>

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
{
    setWindowTitle(tr("Lodestar"));
    resize(800, 600);

    m_list = new QListWidget(this);
    m_list->setObjectName("openedPaths");
    setCentralWidget(m_list);

    m_status = new QLabel(this);
    m_status->setObjectName("statusLabel");
    statusBar()->addWidget(m_status);
}

MainWindow::~MainWindow() = default;

void MainWindow::openPaths(const QStringList& paths, bool diffMode)
{
    for (const QString& p : paths) {
        const QString abs = QFileInfo(p).absoluteFilePath();
        if (m_paths.contains(abs)) continue;
        m_paths.append(abs);
        m_list->addItem(abs);
    }

    if (diffMode && paths.size() == 2) {
        m_status->setText(tr("Comparing %1 with %2").arg(QFileInfo(paths[0]).fileName(), QFileInfo(paths[1]).fileName()));
    } else if (!paths.isEmpty()) {
        m_status->setText(tr("Opened %n item(s)", nullptr, paths.size()));
    }

    if (!m_paths.isEmpty()) {
        setWindowTitle(tr("%1 - Lodestar").arg(QFileInfo(m_paths.last()).fileName()));
    }
}
