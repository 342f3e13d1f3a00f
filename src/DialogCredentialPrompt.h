#pragma once

#include "AskpassChannel.h"

// Asks the user for credentials with modal dialogs. Cancel yields empty strings.
class DialogCredentialPrompt : public CredentialPromptService {
public:
    Credentials askpass(const QString& id, const QString& host, const QString& command) override;
};
