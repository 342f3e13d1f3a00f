#pragma once

#include <QObject>
#include <functional>

#include "LaunchRequest.h"
#include "StartupResult.h"

// Client role: hands a redundant launch over to the instance owning the endpoint.
class LaunchForwarder {
public:
    using Callback = std::function<void(const ForwardResult& result)>;

    virtual ~LaunchForwarder() = default;
    virtual void connectAndForward(const EndpointAddress& address, const LaunchRequest& request, Callback done) = 0;
};

class LocalLaunchForwarder : public QObject, public LaunchForwarder
{
    Q_OBJECT

public:
    // `testSession`: this process runs automated tests and must never hand off.
    explicit LocalLaunchForwarder(bool testSession, QObject* parent = nullptr);

    void connectAndForward(const EndpointAddress& address, const LaunchRequest& request, Callback done) override;

    int openConnections() const { return m_openConnections; }

private:
    bool m_testSession;
    int m_openConnections = 0;
};
