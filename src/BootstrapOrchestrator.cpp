#include "BootstrapOrchestrator.h"
#include "HandleCleaner.h"
#include "InstanceBinder.h"
#include "LaunchForwarder.h"
#include "PlatformIntegration.h"

#include <QPointer>
#include <QDebug>

BootstrapOrchestrator::BootstrapOrchestrator(const EndpointAddress& address,
                                             const LaunchRequest& request,
                                             InstanceBinder& binder,
                                             LaunchForwarder& forwarder,
                                             HandleCleaner& cleaner,
                                             PlatformIntegration& platform,
                                             QObject* parent)
    : QObject(parent)
    , m_address(address)
    , m_request(request)
    , m_binder(binder)
    , m_forwarder(forwarder)
    , m_cleaner(cleaner)
    , m_platform(platform)
{
}

BootstrapOrchestrator::~BootstrapOrchestrator() = default;

void BootstrapOrchestrator::start()
{
    if (m_state != State::Start) {
        qWarning() << "SingleInstance: bootstrap already started";
        return;
    }
    bindEndpoint();
}

std::unique_ptr<IpcServer> BootstrapOrchestrator::takeServer()
{
    return std::move(m_server);
}

void BootstrapOrchestrator::bindEndpoint()
{
    setState(State::Binding);
    ++m_outcome.bindAttempts;

    BindResult result = m_binder.bind(m_address);
    switch (result.status) {
    case BindResult::Status::Bound:
        // the dock may still be hidden from an earlier hand-off attempt
        m_platform.showDockPresence();
        m_server = std::move(result.server);
        finish(StartupOutcome::Kind::Bound, StartupError::None, QString());
        return;

    case BindResult::Status::AddressInUse:
        if (m_retrying) {
            finish(StartupOutcome::Kind::Fatal, StartupError::RetryExhausted,
                   QStringLiteral("%1 is still in use after removing the stale handle").arg(m_address.path));
            return;
        }
        qInfo() << "SingleInstance: endpoint in use, contacting running instance";
        // a second instance should not flash a dock icon
        m_platform.hideDockPresence();
        setState(State::Forwarding);
        {
            QPointer<BootstrapOrchestrator> self(this);
            m_forwarder.connectAndForward(m_address, m_request, [self](const ForwardResult& r) {
                if (self) self->onForwardResult(r);
            });
        }
        return;

    case BindResult::Status::OtherError:
        finish(StartupOutcome::Kind::Fatal,
               m_retrying ? StartupError::RetryExhausted : StartupError::BindFailedOther,
               result.error);
        return;
    }
}

void BootstrapOrchestrator::onForwardResult(const ForwardResult& result)
{
    if (m_state != State::Forwarding) return;

    switch (result.status) {
    case ForwardResult::Status::Sent:
        finish(StartupOutcome::Kind::HandedOff, StartupError::HandedOff,
               QStringLiteral("Sent env to running instance. Terminating..."));
        return;

    case ForwardResult::Status::ConnectionRefused:
        if (!m_platform.staleHandlesPossible()) {
            finish(StartupOutcome::Kind::Fatal, StartupError::StaleHandleUnrecoverable,
                   QStringLiteral("connection to %1 refused: %2").arg(m_address.path, result.message));
            return;
        }
        if (!m_retryAvailable) {
            finish(StartupOutcome::Kind::Fatal, StartupError::RetryExhausted,
                   QStringLiteral("connection to %1 refused again: %2").arg(m_address.path, result.message));
            return;
        }
        cleanAndRetry();
        return;

    case ForwardResult::Status::OtherError:
        finish(StartupOutcome::Kind::Fatal, result.error, result.message);
        return;
    }
}

void BootstrapOrchestrator::cleanAndRetry()
{
    // Nothing listens behind the handle: it was left behind by a crashed instance.
    m_retryAvailable = false;
    m_retrying = true;
    setState(State::Cleaning);
    ++m_outcome.cleanupAttempts;

    const CleanupResult cleanup = m_cleaner.removeStaleHandle(m_address);
    if (cleanup.status != CleanupResult::Status::Removed) {
        qCritical().noquote() << "SingleInstance: fatal error deleting obsolete instance handle:" << cleanup.error;
        finish(StartupOutcome::Kind::Fatal, StartupError::HandleRemovalFailed, cleanup.error);
        return;
    }
    bindEndpoint();
}

void BootstrapOrchestrator::finish(StartupOutcome::Kind kind, StartupError error, const QString& message)
{
    m_outcome.kind = kind;
    m_outcome.error = error;
    m_outcome.message = message;

    switch (kind) {
    case StartupOutcome::Kind::Bound:
        setState(State::Bound);
        break;
    case StartupOutcome::Kind::HandedOff:
        qInfo().noquote() << "SingleInstance:" << message;
        setState(State::Terminating);
        break;
    case StartupOutcome::Kind::Fatal:
        qCritical().noquote() << "SingleInstance: startup failed (" + startupErrorName(error) + "):" << message;
        setState(State::Fatal);
        break;
    case StartupOutcome::Kind::Pending:
        return;
    }
    emit finished(m_outcome);
}

void BootstrapOrchestrator::setState(State state)
{
    if (m_state == state) return;
    m_state = state;
    emit stateChanged(state);
}
