#pragma once

#include "IpcChannel.h"

// Answers credential prompts raised by helper tools (e.g. git's GIT_ASKPASS)
// running on behalf of the main instance.
class CredentialPromptService {
public:
    struct Credentials {
        QString username;
        QString password;
    };

    virtual ~CredentialPromptService() = default;
    virtual Credentials askpass(const QString& id, const QString& host, const QString& command) = 0;
};

class AskpassChannel : public IpcChannel {
public:
    static constexpr const char* NAME = "askpass";

    explicit AskpassChannel(CredentialPromptService& service) : m_service(service) {}
    IpcReply call(const QString& command, const QJsonValue& arg) override;

private:
    CredentialPromptService& m_service;
};
