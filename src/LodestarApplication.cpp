#include "LodestarApplication.h"
#include "LifecycleGuard.h"

#include <QDebug>
#include <cstdlib>
#include <exception>

LodestarApplication::LodestarApplication(int& argc, char** argv)
    : QApplication(argc, argv)
{
}

bool LodestarApplication::notify(QObject* receiver, QEvent* event)
{
    try {
        return QApplication::notify(receiver, event);
    } catch (const std::exception& e) {
        const QString message = QString::fromLocal8Bit(e.what());
        if (!m_guard) {
            qCritical().noquote() << "[uncaught exception in main]:" << message;
            std::_Exit(1);
        }
        m_guard->handleFault(message);
    }
    return false;
}
