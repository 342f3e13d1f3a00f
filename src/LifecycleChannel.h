#pragma once

#include <functional>

#include "IpcChannel.h"

// "exit" requests from helper processes and windows. The request is acknowledged
// first; the exit itself runs on the next event loop turn.
class LifecycleChannel : public IpcChannel {
public:
    static constexpr const char* NAME = "lifecycle";

    explicit LifecycleChannel(std::function<void(int exitCode)> onExit) : m_onExit(std::move(onExit)) {}
    IpcReply call(const QString& command, const QJsonValue& arg) override;

private:
    std::function<void(int)> m_onExit;
};
