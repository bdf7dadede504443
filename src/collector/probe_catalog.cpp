#include "collector/probe_catalog.hpp"

#include <QHash>

#include "collector/block_devices.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/section_labels.hpp"

namespace sysreport {

namespace {

const QHash<QString, std::vector<QStringList>> &builtinCommands()
{
    static const QHash<QString, std::vector<QStringList>> commands = {
        {labels::kAccessInformation, {{QStringLiteral("id")}}},
        {labels::kCpu, {{QStringLiteral("cat"), QStringLiteral("/proc/cpuinfo")}}},
        {labels::kMemory, {{QStringLiteral("free")}}},
        {labels::kNetwork, {{QStringLiteral("ip"), QStringLiteral("addr")}}},
        {labels::kDisks, {{QStringLiteral("lsblk"), QStringLiteral("-o"),
                           QStringLiteral("NAME,MAJ:MIN,RM,SIZE,RO,FSTYPE,MOUNTPOINT,UUID")}}},
        {labels::kMount, {{QStringLiteral("mount")}}},
        {labels::kZfsPools, {{QStringLiteral("zpool"), QStringLiteral("list")},
                             {QStringLiteral("zpool"), QStringLiteral("status")}}},
        {labels::kRcStatus, {{QStringLiteral("rc-status")}}},
        {labels::kUsb, {{QStringLiteral("lsusb")}}},
        {labels::kUpgradablePackages, {{QStringLiteral("apk"), QStringLiteral("version"),
                                        QStringLiteral("-l"), QStringLiteral("<")}}},
        {labels::kProcesses, {{QStringLiteral("ps")}}},
        {labels::kUsers, {{QStringLiteral("cut"), QStringLiteral("-d:"), QStringLiteral("-f1"),
                           QStringLiteral("/etc/passwd")}}},
        {labels::kGroups, {{QStringLiteral("cut"), QStringLiteral("-d:"), QStringLiteral("-f1"),
                            QStringLiteral("/etc/group")}}},
    };
    return commands;
}

std::vector<QStringList> commandsFor(const Config &config, const QString &label)
{
    const auto it = config.probeCommands.constFind(label);
    if (it != config.probeCommands.cend()) {
        return {it.value()};
    }
    return defaultProbeCommands(label);
}

QString captureAll(const ProbeContext &context, const QString &label)
{
    QString text;
    for (const QStringList &argv : commandsFor(context.config, label)) {
        if (!text.isEmpty() && !text.endsWith(QLatin1Char('\n'))) {
            text.append(QLatin1Char('\n'));
        }
        text.append(captureCommand(context.runner, argv, context.config.probeTimeoutMs));
    }
    return text;
}

// First output line of a command, for "key: value" header lines.
QString captureValue(const ProbeContext &context, const QStringList &argv)
{
    const QString text = captureCommand(context.runner, argv, context.config.probeTimeoutMs);
    const QString trimmed = text.trimmed();
    const qsizetype newline = trimmed.indexOf(QLatin1Char('\n'));
    if (newline < 0) {
        return trimmed;
    }
    return trimmed.left(newline).trimmed();
}

QString statusInformation(const ProbeContext &context)
{
    const auto stamp = context.timestamp;
    QStringList lines;
    lines << QStringLiteral("user: %1").arg(captureValue(context, {QStringLiteral("whoami")}));
    lines << QStringLiteral("date: %1")
                 .arg(QString::fromStdString(formatLocalTime(stamp, "%Y-%m-%d")));
    lines << QStringLiteral("time: %1")
                 .arg(QString::fromStdString(formatLocalTime(stamp, "%H:%M:%S")));
    lines << QStringLiteral("timezone: %1")
                 .arg(QString::fromStdString(formatLocalTime(stamp, "%Z (%z)")));
    lines << QStringLiteral("hostname: %1").arg(context.config.hostname);
    lines << QStringLiteral("Operating system: %1")
                 .arg(captureValue(context,
                                   {QStringLiteral("sh"), QStringLiteral("-c"),
                                    QStringLiteral(". /etc/os-release && echo \"$PRETTY_NAME\"")}));
    lines << QStringLiteral("Kernel version: %1")
                 .arg(captureValue(context, {QStringLiteral("uname"), QStringLiteral("-srvm")}));
    lines << QStringLiteral("uptime: %1").arg(captureValue(context, {QStringLiteral("uptime")}));
    lines << QStringLiteral("send e-mail: %1")
                 .arg(context.sendMail ? QStringLiteral("yes") : QStringLiteral("no"));
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString externalIpAddress(const ProbeContext &context)
{
    const PublicIpResult result =
        context.ipLookup.lookup(context.config.publicIpUrl, context.config.networkTimeoutMs);
    if (!result.ok) {
        return QStringLiteral("[unavailable: public IP lookup failed: %1]\n").arg(result.error);
    }
    return result.address + QLatin1Char('\n');
}

} // namespace

std::vector<QStringList> defaultProbeCommands(const QString &label)
{
    const auto &commands = builtinCommands();
    const auto it = commands.constFind(label);
    if (it == commands.cend()) {
        return {};
    }
    return it.value();
}

QString captureCommand(CommandRunner &runner, const QStringList &argv, int timeoutMs)
{
    if (argv.isEmpty()) {
        return QStringLiteral("[unavailable: empty command]\n");
    }

    const QString program = argv.first();
    const QStringList arguments = argv.mid(1);
    const CommandResult result = runner.run(program, arguments, timeoutMs);
    const QString command = describeCommand(program, arguments);

    if (!result.started) {
        return QStringLiteral("[unavailable: %1 could not be started]\n").arg(command);
    }

    QString text = QString::fromUtf8(result.standardOutput);
    if (result.timedOut) {
        if (!text.isEmpty() && !text.endsWith(QLatin1Char('\n'))) {
            text.append(QLatin1Char('\n'));
        }
        text.append(QStringLiteral("[unavailable: %1 timed out after %2 ms]\n")
                        .arg(command)
                        .arg(timeoutMs));
    } else if (result.exitCode != 0) {
        SYSREPORT_LOG_DEBUG(QStringLiteral("ProbeCatalog"),
                            QStringLiteral("captureCommand"),
                            QStringLiteral("probe_nonzero_exit"),
                            (nlohmann::json{{"command", command.toStdString()},
                                            {"exitCode", result.exitCode}}));
    }
    return text;
}

QString collectDriveHealth(const Config &config, CommandRunner &runner)
{
    const auto devices = discoverBlockDevices(config.blockDeviceDir,
                                              config.deviceNodeDir,
                                              config.devicePatterns);
    QString text;
    for (const BlockDevice &device : devices) {
        text.append(QStringLiteral("== %1 ==\n").arg(device.nodePath));
        text.append(captureCommand(runner,
                                   {QStringLiteral("smartctl"), QStringLiteral("-H"), device.nodePath},
                                   config.probeTimeoutMs));
        if (!text.endsWith(QLatin1Char('\n'))) {
            text.append(QLatin1Char('\n'));
        }
        text.append(captureCommand(runner,
                                   {QStringLiteral("smartctl"), QStringLiteral("-i"), device.nodePath},
                                   config.probeTimeoutMs));
        if (!text.endsWith(QLatin1Char('\n'))) {
            text.append(QLatin1Char('\n'));
        }
    }
    return text;
}

std::vector<ProbeDefinition> buildProbeCatalog(const ProbeContext &context)
{
    std::vector<ProbeDefinition> probes;
    for (const QString &label : labels::all()) {
        ProbeDefinition probe;
        probe.label = label;
        probe.style = labels::isBanner(label) ? SectionStyle::Banner : SectionStyle::Module;

        if (label == labels::kStatusInformation) {
            probe.produce = [&context]() { return statusInformation(context); };
        } else if (label == labels::kExternalIp) {
            probe.produce = [&context]() { return externalIpAddress(context); };
        } else if (label == labels::kSmartStatus) {
            probe.produce = [&context]() {
                return collectDriveHealth(context.config, context.runner);
            };
        } else {
            probe.produce = [&context, label]() { return captureAll(context, label); };
        }
        probes.push_back(std::move(probe));
    }
    return probes;
}

ReportSection evaluateProbe(const ProbeDefinition &probe)
{
    ReportSection section;
    section.label = probe.label.toStdString();
    section.style = probe.style;
    section.body = probe.produce().toStdString();
    return section;
}

} // namespace sysreport
