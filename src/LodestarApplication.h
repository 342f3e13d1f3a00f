#pragma once

#include <QApplication>

class LifecycleGuard;

// QApplication that routes exceptions escaping event handlers to the lifecycle guard.
class LodestarApplication : public QApplication
{
    Q_OBJECT
public:
    LodestarApplication(int& argc, char** argv);

    void setLifecycleGuard(LifecycleGuard* guard) { m_guard = guard; }
    bool notify(QObject* receiver, QEvent* event) override;

private:
    LifecycleGuard* m_guard = nullptr;
};
