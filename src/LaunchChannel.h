#pragma once

#include <functional>

#include "IpcChannel.h"
#include "LaunchRequest.h"

class IpcClient;

// Receives launch requests forwarded by redundant process starts.
class LaunchService {
public:
    virtual ~LaunchService() = default;
    virtual bool start(const LaunchRequest& request, QString* error) = 0;
};

class LaunchChannel : public IpcChannel {
public:
    static constexpr const char* NAME = "launch";

    explicit LaunchChannel(LaunchService& service) : m_service(service) {}
    IpcReply call(const QString& command, const QJsonValue& arg) override;

private:
    LaunchService& m_service;
};

class LaunchChannelClient {
public:
    using Callback = std::function<void(bool ok, const QString& error)>;

    explicit LaunchChannelClient(IpcClient& client) : m_client(client) {}
    void start(const LaunchRequest& request, Callback done);

private:
    IpcClient& m_client;
};
