#pragma once

#include <QString>
#include <memory>

#include "IpcServer.h"

// Why startup did not end with this process owning the endpoint.
enum class StartupError {
    None,
    HandedOff,                 // benign: launch forwarded to the running instance
    BindFailedOther,
    ForwardFailed,
    TestSessionConflict,
    StaleHandleUnrecoverable,  // connection refused where stale handles are not retried
    HandleRemovalFailed,
    RetryExhausted
};

QString startupErrorName(StartupError error);

struct BindResult {
    enum class Status { Bound, AddressInUse, OtherError };

    Status status = Status::OtherError;
    std::unique_ptr<IpcServer> server;
    QString error;

    static BindResult bound(std::unique_ptr<IpcServer> server);
    static BindResult addressInUse(const QString& detail = QString());
    static BindResult otherError(const QString& error);
};

struct ForwardResult {
    enum class Status { Sent, ConnectionRefused, OtherError };

    Status status = Status::OtherError;
    StartupError error = StartupError::ForwardFailed;
    QString message;

    static ForwardResult sent();
    static ForwardResult connectionRefused(const QString& detail);
    static ForwardResult failed(StartupError error, const QString& message);
};

struct CleanupResult {
    enum class Status { Removed, OtherError };

    Status status = Status::Removed;
    bool existed = false;
    QString error;

    static CleanupResult removed(bool existed);
    static CleanupResult failed(const QString& error);
};

struct StartupOutcome {
    enum class Kind { Pending, Bound, HandedOff, Fatal };

    Kind kind = Kind::Pending;
    StartupError error = StartupError::None;
    QString message;
    int bindAttempts = 0;
    int cleanupAttempts = 0;

    // 0 for Bound and a successful hand-off, 1 for every fatal condition.
    int exitCode() const { return kind == Kind::Fatal ? 1 : 0; }
    bool isTerminal() const { return kind != Kind::Pending; }
};
