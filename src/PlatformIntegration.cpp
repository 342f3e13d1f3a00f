#include "PlatformIntegration.h"

#include <QDebug>

DesktopPlatformIntegration::DesktopPlatformIntegration(bool staleHandlesPossible)
    : m_staleHandlesPossible(staleHandlesPossible)
{
}

bool DesktopPlatformIntegration::defaultStaleHandlesPossible()
{
#ifdef Q_OS_WIN
    return false;
#else
    return true;
#endif
}

QString DesktopPlatformIntegration::appUserModelId(const QString& productName, bool isBuilt)
{
    const QString id = productName.toLower();
    return isBuilt ? id : id + QStringLiteral("-dev");
}

void DesktopPlatformIntegration::showDockPresence()
{
    if (m_dockVisible) return;
    m_dockVisible = true;
#ifdef Q_OS_MACOS
    qInfo() << "Platform: showing dock icon";
#endif
}

void DesktopPlatformIntegration::hideDockPresence()
{
    if (!m_dockVisible) return;
    m_dockVisible = false;
#ifdef Q_OS_MACOS
    qInfo() << "Platform: hiding dock icon while handing off";
#endif
}
