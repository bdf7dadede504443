#include "collector/CollectorCli.hpp"

#include <QCommandLineParser>
#include <QStringList>

#include <iostream>

#include <nlohmann/json.hpp>

#include "collector/mailer.hpp"
#include "collector/public_ip.hpp"
#include "collector/report_collector.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace sysreport {

namespace {

constexpr int kExitUsage = 2;

} // namespace

int CollectorCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Write a timestamped system status report, optionally mailing it."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    QCommandLineOption configOption(QStringList() << "config",
                                    "Read configuration from <path>.", "path");
    QCommandLineOption reportDirOption(QStringList() << "report-dir",
                                       "Write reports into <dir>.", "dir");
    QCommandLineOption hostnameOption(QStringList() << "hostname",
                                      "Host name used in the report and mail subject.", "name");
    QCommandLineOption recipientOption(QStringList() << "recipient",
                                       "Mail the report to <address>.", "address");
    QCommandLineOption verboseOption(QStringList() << "verbose",
                                     "Write debug events to the diagnostic log.");
    parser.addOption(configOption);
    parser.addOption(reportDirOption);
    parser.addOption(hostnameOption);
    parser.addOption(recipientOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument("mail", "Literal \"mail\" to also email the report.", "[mail]");

    if (!parser.parse(args)) {
        std::cerr << "error: " << parser.errorText().toStdString() << "\n"
                  << "usage: sysreport [options] [mail]" << std::endl;
        return kExitUsage;
    }
    if (parser.isSet(helpOption)) {
        std::cout << parser.helpText().toStdString();
        return 0;
    }

    const bool verbose = parser.isSet(verboseOption)
        || qEnvironmentVariableIntValue("SYSREPORT_VERBOSE") == 1;
    logging::initLogging(QStringLiteral("sysreport"), verbose);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1
        || (positional.size() == 1 && positional.first() != QStringLiteral("mail"))) {
        std::cerr << "usage: sysreport [options] [mail]" << std::endl;
        return kExitUsage;
    }
    const bool sendMail = positional.size() == 1;

    QString configError;
    auto config = loadConfig(parser.value(configOption), &configError);
    if (!config.has_value()) {
        std::cerr << "error: " << configError.toStdString() << std::endl;
        SYSREPORT_LOG_ERROR(QStringLiteral("CollectorCli"),
                            QStringLiteral("run"),
                            QStringLiteral("config_invalid"),
                            (nlohmann::json{{"error", configError.toStdString()}}));
        return kExitUsage;
    }
    if (parser.isSet(reportDirOption)) {
        config->reportDir = parser.value(reportDirOption);
    }
    if (parser.isSet(hostnameOption)) {
        config->hostname = parser.value(hostnameOption);
    }
    if (parser.isSet(recipientOption)) {
        config->recipient = parser.value(recipientOption);
    }
    resolveDerivedDefaults(*config);

    const QString invalid = validateConfig(*config);
    if (!invalid.isEmpty()) {
        std::cerr << "error: " << invalid.toStdString() << std::endl;
        SYSREPORT_LOG_ERROR(QStringLiteral("CollectorCli"),
                            QStringLiteral("run"),
                            QStringLiteral("config_invalid"),
                            (nlohmann::json{{"error", invalid.toStdString()}}));
        return kExitUsage;
    }

    SYSREPORT_LOG_INFO(QStringLiteral("CollectorCli"),
                       QStringLiteral("run"),
                       QStringLiteral("sysreport_start"),
                       (nlohmann::json{{"mail", sendMail},
                                       {"config", config->sourcePath.toStdString()}}));

    QProcessCommandRunner runner;
    NetworkPublicIpLookup ipLookup;
    CommandMailSender mailSender(runner, config->mailCommand, config->probeTimeoutMs);

    ReportCollector collector(*config, runner, ipLookup, mailSender);
    const RunOutcome outcome = collector.run(sendMail);
    return outcome.exitCode();
}

} // namespace sysreport
