#include "DialogCredentialPrompt.h"

#include <QApplication>
#include <QInputDialog>
#include <QLineEdit>
#include <QDebug>

CredentialPromptService::Credentials DialogCredentialPrompt::askpass(const QString& id, const QString& host,
                                                                     const QString& command)
{
    qInfo() << "Askpass: prompt" << id << "for" << host;
    Credentials creds;
    QWidget* parent = QApplication::activeWindow();
    const QString title = QObject::tr("Credentials for %1").arg(host.isEmpty() ? command : host);

    bool ok = false;
    creds.username = QInputDialog::getText(parent, title, QObject::tr("Username:"), QLineEdit::Normal, QString(), &ok);
    if (!ok) return Credentials();
    creds.password = QInputDialog::getText(parent, title, QObject::tr("Password:"), QLineEdit::Password, QString(), &ok);
    if (!ok) return Credentials();
    return creds;
}
