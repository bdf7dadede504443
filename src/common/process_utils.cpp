#include "common/process_utils.hpp"

#include <QProcess>

#include "common/logging.hpp"

namespace sysreport {

QString describeCommand(const QString &program, const QStringList &arguments)
{
    if (arguments.isEmpty()) {
        return program;
    }
    return program + QLatin1Char(' ') + arguments.join(QLatin1Char(' '));
}

CommandResult QProcessCommandRunner::run(const QString &program,
                                         const QStringList &arguments,
                                         int timeoutMs,
                                         const QByteArray &standardInput)
{
    CommandResult result;
    result.program = program;
    result.arguments = arguments;

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted(timeoutMs)) {
        SYSREPORT_LOG_DEBUG(QStringLiteral("CommandRunner"),
                            QStringLiteral("run"),
                            QStringLiteral("command_not_started"),
                            (nlohmann::json{{"command", describeCommand(program, arguments).toStdString()},
                                            {"error", process.errorString().toStdString()}}));
        return result;
    }
    result.started = true;

    if (!standardInput.isEmpty()) {
        process.write(standardInput);
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        result.timedOut = true;
        process.kill();
        process.waitForFinished();
        result.standardOutput = process.readAllStandardOutput();
        SYSREPORT_LOG_WARN(QStringLiteral("CommandRunner"),
                           QStringLiteral("run"),
                           QStringLiteral("command_timeout"),
                           (nlohmann::json{{"command", describeCommand(program, arguments).toStdString()},
                                           {"timeoutMs", timeoutMs}}));
        return result;
    }

    result.standardOutput = process.readAllStandardOutput();
    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    return result;
}

} // namespace sysreport
