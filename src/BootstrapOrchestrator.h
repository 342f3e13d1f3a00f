#pragma once

#include <QObject>
#include <memory>

#include "EndpointIdentity.h"
#include "LaunchRequest.h"
#include "StartupResult.h"

class InstanceBinder;
class LaunchForwarder;
class HandleCleaner;
class PlatformIntegration;

/**
 * BootstrapOrchestrator: decides whether this process becomes the running
 * instance or hands its launch over to the one that already is.
 *
 *   Binding --Bound--> done (we own the endpoint)
 *   Binding --AddressInUse--> Forwarding --Sent--> Terminating (exit 0)
 *   Forwarding --ConnectionRefused--> Cleaning --> Binding (once)
 *   anything else --> Fatal (exit 1)
 *
 * The stale-handle cleanup runs at most once per process; a second failed
 * bind is fatal so a broken handle cannot put startup into a loop.
 */
class BootstrapOrchestrator : public QObject
{
    Q_OBJECT

public:
    enum class State { Start, Binding, Forwarding, Cleaning, Bound, Terminating, Fatal };
    Q_ENUM(State)

    BootstrapOrchestrator(const EndpointAddress& address,
                          const LaunchRequest& request,
                          InstanceBinder& binder,
                          LaunchForwarder& forwarder,
                          HandleCleaner& cleaner,
                          PlatformIntegration& platform,
                          QObject* parent = nullptr);
    ~BootstrapOrchestrator() override;

    void start();

    State state() const { return m_state; }
    const StartupOutcome& outcome() const { return m_outcome; }
    bool retryAvailable() const { return m_retryAvailable; }

    // Ownership of the bound server passes to the caller; valid once state() == Bound.
    std::unique_ptr<IpcServer> takeServer();

signals:
    void stateChanged(BootstrapOrchestrator::State state);
    void finished(const StartupOutcome& outcome);

private:
    void bindEndpoint();
    void onForwardResult(const ForwardResult& result);
    void cleanAndRetry();
    void finish(StartupOutcome::Kind kind, StartupError error, const QString& message);
    void setState(State state);

    EndpointAddress m_address;
    LaunchRequest m_request;
    InstanceBinder& m_binder;
    LaunchForwarder& m_forwarder;
    HandleCleaner& m_cleaner;
    PlatformIntegration& m_platform;

    State m_state = State::Start;
    StartupOutcome m_outcome;
    std::unique_ptr<IpcServer> m_server;
    bool m_retryAvailable = true;
    bool m_retrying = false;
};
