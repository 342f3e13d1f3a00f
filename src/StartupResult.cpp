#include "StartupResult.h"

QString startupErrorName(StartupError error)
{
    switch (error) {
    case StartupError::None: return QStringLiteral("None");
    case StartupError::HandedOff: return QStringLiteral("HandedOff");
    case StartupError::BindFailedOther: return QStringLiteral("BindFailedOther");
    case StartupError::ForwardFailed: return QStringLiteral("ForwardFailed");
    case StartupError::TestSessionConflict: return QStringLiteral("TestSessionConflict");
    case StartupError::StaleHandleUnrecoverable: return QStringLiteral("StaleHandleUnrecoverable");
    case StartupError::HandleRemovalFailed: return QStringLiteral("HandleRemovalFailed");
    case StartupError::RetryExhausted: return QStringLiteral("RetryExhausted");
    }
    return QStringLiteral("Unknown");
}

BindResult BindResult::bound(std::unique_ptr<IpcServer> server)
{
    BindResult r;
    r.status = Status::Bound;
    r.server = std::move(server);
    return r;
}

BindResult BindResult::addressInUse(const QString& detail)
{
    BindResult r;
    r.status = Status::AddressInUse;
    r.error = detail;
    return r;
}

BindResult BindResult::otherError(const QString& error)
{
    BindResult r;
    r.status = Status::OtherError;
    r.error = error;
    return r;
}

ForwardResult ForwardResult::sent()
{
    ForwardResult r;
    r.status = Status::Sent;
    r.error = StartupError::HandedOff;
    return r;
}

ForwardResult ForwardResult::connectionRefused(const QString& detail)
{
    ForwardResult r;
    r.status = Status::ConnectionRefused;
    r.error = StartupError::StaleHandleUnrecoverable;
    r.message = detail;
    return r;
}

ForwardResult ForwardResult::failed(StartupError error, const QString& message)
{
    ForwardResult r;
    r.status = Status::OtherError;
    r.error = error;
    r.message = message;
    return r;
}

CleanupResult CleanupResult::removed(bool existed)
{
    CleanupResult r;
    r.status = Status::Removed;
    r.existed = existed;
    return r;
}

CleanupResult CleanupResult::failed(const QString& error)
{
    CleanupResult r;
    r.status = Status::OtherError;
    r.existed = true;
    r.error = error;
    return r;
}
