#pragma once

#include <chrono>
#include <functional>

#include <QString>

#include "common/config.hpp"
#include "common/models.hpp"
#include "common/process_utils.hpp"
#include "collector/mailer.hpp"
#include "collector/public_ip.hpp"

namespace sysreport {

struct RunOutcome {
    bool written = false;
    QString path;
    QString error;

    bool mailAttempted = false;
    bool mailed = false;
    QString mailError;

    // 0 when the report was persisted, regardless of mail delivery.
    int exitCode() const
    {
        return written ? 0 : 1;
    }
};

/**
 * ReportCollector runs one collection pass:
 * - evaluates every probe of the catalog in order
 * - writes the rendered report into Config::reportDir
 * - optionally mails it to Config::recipient
 *
 * Progress goes to stdout, warnings and errors to stderr.
 */
class ReportCollector
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    ReportCollector(const Config &config,
                    CommandRunner &runner,
                    PublicIpLookup &ipLookup,
                    MailSender &mailSender);

    // Replaces the wall clock used for the report timestamp.
    void setClock(Clock clock);

    Report collect(bool sendMail);

    RunOutcome run(bool sendMail);

private:
    const Config &m_config;
    CommandRunner &m_runner;
    PublicIpLookup &m_ipLookup;
    MailSender &m_mailSender;
    Clock m_clock;
};

} // namespace sysreport
