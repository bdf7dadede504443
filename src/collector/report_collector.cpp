#include "collector/report_collector.hpp"

#include <iostream>
#include <utility>

#include "collector/probe_catalog.hpp"
#include "collector/report_writer.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace sysreport {

ReportCollector::ReportCollector(const Config &config,
                                 CommandRunner &runner,
                                 PublicIpLookup &ipLookup,
                                 MailSender &mailSender)
    : m_config(config)
    , m_runner(runner)
    , m_ipLookup(ipLookup)
    , m_mailSender(mailSender)
    , m_clock([]() { return std::chrono::system_clock::now(); })
{
}

void ReportCollector::setClock(Clock clock)
{
    m_clock = std::move(clock);
}

Report ReportCollector::collect(bool sendMail)
{
    Report report;
    report.timestamp = m_clock();
    report.hostname = m_config.hostname.toStdString();

    const ProbeContext context{m_config, m_runner, m_ipLookup, report.timestamp, sendMail};
    const auto probes = buildProbeCatalog(context);
    for (const ProbeDefinition &probe : probes) {
        std::cout << "Collecting " << probe.label.toStdString() << "..." << std::endl;
        report.sections.push_back(evaluateProbe(probe));
        SYSREPORT_LOG_DEBUG(QStringLiteral("ReportCollector"),
                            QStringLiteral("collect"),
                            QStringLiteral("probe_done"),
                            (nlohmann::json{{"section", report.sections.back()}}));
    }
    return report;
}

RunOutcome ReportCollector::run(bool sendMail)
{
    RunOutcome outcome;

    SYSREPORT_LOG_INFO(QStringLiteral("ReportCollector"),
                       QStringLiteral("run"),
                       QStringLiteral("collection_start"),
                       (nlohmann::json{{"hostname", m_config.hostname.toStdString()},
                                       {"reportDir", m_config.reportDir.toStdString()},
                                       {"mail", sendMail}}));

    Report report = collect(sendMail);

    const WriteResult written = writeReport(m_config.reportDir, report);
    if (!written.ok) {
        outcome.error = written.error;
        std::cerr << "error: " << written.error.toStdString() << std::endl;
        SYSREPORT_LOG_ERROR(QStringLiteral("ReportCollector"),
                            QStringLiteral("run"),
                            QStringLiteral("report_write_failed"),
                            (nlohmann::json{{"error", written.error.toStdString()}}));
        return outcome;
    }
    outcome.written = true;
    outcome.path = written.path;
    std::cout << "Report written to " << written.path.toStdString() << std::endl;

    if (sendMail) {
        outcome.mailAttempted = true;
        MailMessage message;
        message.from = m_config.sender;
        message.to = m_config.recipient;
        message.subject = mailSubject(m_config.hostname);
        message.body = QString::fromUtf8(renderReport(report));

        const MailResult mailed = m_mailSender.send(message);
        if (mailed.ok) {
            outcome.mailed = true;
            report.emailed = true;
            std::cout << "Report mailed to " << m_config.recipient.toStdString() << std::endl;
        } else {
            outcome.mailError = mailed.error;
            std::cerr << "warning: could not mail report: " << mailed.error.toStdString()
                      << std::endl;
        }
    }

    SYSREPORT_LOG_INFO(QStringLiteral("ReportCollector"),
                       QStringLiteral("run"),
                       QStringLiteral("collection_done"),
                       (nlohmann::json{{"path", report.path},
                                       {"mailRequested", sendMail},
                                       {"emailed", report.emailed}}));
    return outcome;
}

} // namespace sysreport
