#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

#include "common/process_utils.hpp"

namespace sysreport {

struct MailMessage {
    QString from;
    QString to;
    QString subject;
    QString body;
};

struct MailResult {
    bool ok = false;
    QString error;
};

class MailSender
{
public:
    virtual ~MailSender() = default;

    virtual MailResult send(const MailMessage &message) = 0;
};

// Pipes an RFC 5322 message to a sendmail-compatible command ("sendmail -t").
class CommandMailSender : public MailSender
{
public:
    CommandMailSender(CommandRunner &runner, QStringList command, int timeoutMs);

    MailResult send(const MailMessage &message) override;

private:
    CommandRunner &m_runner;
    QStringList m_command;
    int m_timeoutMs;
};

QString mailSubject(const QString &hostname);

QByteArray composeMessage(const MailMessage &message);

} // namespace sysreport
