#pragma once

#include <QObject>
#include <QList>

class QSocketNotifier;

// Turns SIGTERM/SIGINT/SIGHUP into a Qt signal delivered on the event loop.
// The handler itself only writes the signal number to a socketpair.
class UnixSignalWatcher : public QObject
{
    Q_OBJECT

public:
    explicit UnixSignalWatcher(QObject* parent = nullptr);
    ~UnixSignalWatcher() override;

    bool watch(const QList<int>& signalNumbers, QString* error = nullptr);

signals:
    void signalReceived(int signalNumber);

private:
    QSocketNotifier* m_notifier = nullptr;
    QList<int> m_watched;
};
