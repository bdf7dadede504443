#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace sysreport {

struct CommandResult {
    QString program;
    QStringList arguments;
    QByteArray standardOutput;
    int exitCode = -1;
    bool started = false;
    bool timedOut = false;

    bool succeeded() const
    {
        return started && !timedOut && exitCode == 0;
    }
};

// Runs external programs. Implementations never throw; failures are reported
// through the returned CommandResult.
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const QString &program,
                              const QStringList &arguments,
                              int timeoutMs,
                              const QByteArray &standardInput = QByteArray()) = 0;
};

class QProcessCommandRunner : public CommandRunner
{
public:
    CommandResult run(const QString &program,
                      const QStringList &arguments,
                      int timeoutMs,
                      const QByteArray &standardInput = QByteArray()) override;
};

// "program arg1 arg2", for messages.
QString describeCommand(const QString &program, const QStringList &arguments);

} // namespace sysreport
