#include "collector/mailer.hpp"

#include <utility>

#include <QDateTime>

#include "common/logging.hpp"

namespace sysreport {

CommandMailSender::CommandMailSender(CommandRunner &runner, QStringList command, int timeoutMs)
    : m_runner(runner)
    , m_command(std::move(command))
    , m_timeoutMs(timeoutMs)
{
}

MailResult CommandMailSender::send(const MailMessage &message)
{
    MailResult result;
    if (m_command.isEmpty()) {
        result.error = QStringLiteral("no mail command configured");
        return result;
    }

    const QString program = m_command.first();
    const QStringList arguments = m_command.mid(1);
    const CommandResult run =
        m_runner.run(program, arguments, m_timeoutMs, composeMessage(message));
    const QString command = describeCommand(program, arguments);

    if (!run.started) {
        result.error = QStringLiteral("%1 could not be started").arg(command);
    } else if (run.timedOut) {
        result.error = QStringLiteral("%1 timed out after %2 ms").arg(command).arg(m_timeoutMs);
    } else if (run.exitCode != 0) {
        result.error = QStringLiteral("%1 exited with status %2").arg(command).arg(run.exitCode);
    } else {
        result.ok = true;
    }

    SYSREPORT_LOG_INFO(QStringLiteral("Mailer"),
                       QStringLiteral("send"),
                       result.ok ? QStringLiteral("mail_sent") : QStringLiteral("mail_failed"),
                       (nlohmann::json{{"to", message.to.toStdString()},
                                       {"subject", message.subject.toStdString()},
                                       {"error", result.error.toStdString()}}));
    return result;
}

QString mailSubject(const QString &hostname)
{
    return QStringLiteral("System status %1").arg(hostname);
}

QByteArray composeMessage(const MailMessage &message)
{
    QByteArray out;
    out += "From: " + message.from.toUtf8() + "\n";
    out += "To: " + message.to.toUtf8() + "\n";
    out += "Subject: " + message.subject.toUtf8() + "\n";
    out += "Date: " + QDateTime::currentDateTime().toString(Qt::RFC2822Date).toUtf8() + "\n";
    out += "MIME-Version: 1.0\n";
    out += "Content-Type: text/plain; charset=UTF-8\n";
    out += "\n";
    out += message.body.toUtf8();
    if (!out.endsWith('\n')) {
        out += '\n';
    }
    return out;
}

} // namespace sysreport
