#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <memory>

#include <nlohmann/json.hpp>

#include "collector/report_collector.hpp"
#include "common/logging.hpp"
#include "common/json_utils.hpp"
#include "common/section_labels.hpp"
#include "fakes.hpp"

class CollectorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();

    void testHeadersPresentInOrderWithEmptyOutput();
    void testMissingProbeDoesNotAbort();
    void testNoMailWithoutFlag();
    void testMailSentOnceToRecipient();
    void testMailFailureStillSucceeds();
    void testNoMatchingDrivesLeavesSmartSectionEmpty();
    void testDriveHealthCoversExistingDevicesOnly();
    void testPublicIpFailureIsMarked();
    void testProbeCommandOverride();
    void testWriteFailureIsFatal();
    void testSameSecondRunsProduceDistinctFiles();
    void testCompletionLogRecordsMailDelivery();

private:
    void addDevice(const QString &name, bool withNode);
    QString readReport(const QString &path) const;
    sysreport::RunOutcome runCollector(bool sendMail);
    nlohmann::json lastLogEvent(const std::string &what) const;

    QTemporaryDir m_logDir;
    std::unique_ptr<QTemporaryDir> m_tempDir;
    sysreport::Config m_config;
    sysreport::testing::FakeCommandRunner m_runner;
    sysreport::testing::FakePublicIpLookup m_ipLookup;
    sysreport::testing::FakeMailSender m_mailSender;
};

void CollectorTests::initTestCase()
{
    QVERIFY(m_logDir.isValid());
    qputenv("SYSREPORT_LOG_DIR", m_logDir.path().toUtf8());
    sysreport::logging::initLogging(QStringLiteral("sysreport-collector-test"), false);
}

void CollectorTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    QVERIFY(QDir().mkpath(m_tempDir->path() + "/sys/block"));
    QVERIFY(QDir().mkpath(m_tempDir->path() + "/dev"));

    m_config = sysreport::defaultConfig();
    m_config.hostname = QStringLiteral("nas01");
    m_config.recipient = QStringLiteral("ops@example.org");
    m_config.reportDir = m_tempDir->path() + "/reports";
    m_config.blockDeviceDir = m_tempDir->path() + "/sys/block";
    m_config.deviceNodeDir = m_tempDir->path() + "/dev";
    sysreport::resolveDerivedDefaults(m_config);

    m_runner = sysreport::testing::FakeCommandRunner();
    m_ipLookup = sysreport::testing::FakePublicIpLookup();
    m_mailSender = sysreport::testing::FakeMailSender();
}

void CollectorTests::addDevice(const QString &name, bool withNode)
{
    QDir().mkpath(m_tempDir->path() + "/sys/block/" + name);
    if (withNode) {
        QFile node(m_tempDir->path() + "/dev/" + name);
        QVERIFY(node.open(QIODevice::WriteOnly));
    }
}

QString CollectorTests::readReport(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QString();
    }
    return QString::fromUtf8(file.readAll());
}

nlohmann::json CollectorTests::lastLogEvent(const std::string &what) const
{
    QFile file(m_logDir.path() + "/sysreport-collector-test.log");
    if (!file.open(QIODevice::ReadOnly)) {
        return nlohmann::json();
    }
    nlohmann::json found;
    while (!file.atEnd()) {
        const auto event = nlohmann::json::parse(file.readLine().toStdString(), nullptr, false);
        if (event.is_object() && event.value("what", "") == what) {
            found = event;
        }
    }
    return found;
}

sysreport::RunOutcome CollectorTests::runCollector(bool sendMail)
{
    sysreport::ReportCollector collector(m_config, m_runner, m_ipLookup, m_mailSender);
    return collector.run(sendMail);
}

void CollectorTests::testHeadersPresentInOrderWithEmptyOutput()
{
    m_runner.echoCommands = false;
    m_ipLookup.next = sysreport::PublicIpResult{true, QString(), QString()};

    const auto outcome = runCollector(false);
    QCOMPARE(outcome.exitCode(), 0);
    QVERIFY(QFile::exists(outcome.path));

    const QString text = readReport(outcome.path);
    qsizetype previous = -1;
    for (const QString &label : sysreport::labels::all()) {
        const QString header = sysreport::labels::isBanner(label)
            ? label + QLatin1Char('\n')
            : QStringLiteral("# ") + label + QStringLiteral(":\n");
        const qsizetype position = text.indexOf(header);
        QVERIFY2(position > previous, qPrintable(label));
        previous = position;
    }
    QVERIFY(text.contains(QStringLiteral("hostname: nas01\n")));
    QVERIFY(text.contains(QStringLiteral("send e-mail: no\n")));
}

void CollectorTests::testMissingProbeDoesNotAbort()
{
    m_runner.missingPrograms.insert(QStringLiteral("lsusb"));
    m_runner.missingPrograms.insert(QStringLiteral("zpool"));
    m_runner.respond(QStringLiteral("free"), QByteArray("partial output\n"), 1);

    const auto outcome = runCollector(false);
    QCOMPARE(outcome.exitCode(), 0);

    const QString text = readReport(outcome.path);
    QVERIFY(text.contains(QStringLiteral("# USB:\n[unavailable: lsusb could not be started]\n")));
    QVERIFY(text.contains(QStringLiteral("[unavailable: zpool list could not be started]")));
    QVERIFY(text.contains(QStringLiteral("[unavailable: zpool status could not be started]")));
    QVERIFY(text.contains(QStringLiteral("# MEMORY:\npartial output\n")));
    QVERIFY(text.contains(QStringLiteral("# PROCESSES:\noutput of ps\n")));
}

void CollectorTests::testNoMailWithoutFlag()
{
    const auto outcome = runCollector(false);
    QCOMPARE(outcome.exitCode(), 0);
    QVERIFY(!outcome.mailAttempted);
    QVERIFY(m_mailSender.sent.empty());
}

void CollectorTests::testMailSentOnceToRecipient()
{
    const auto outcome = runCollector(true);
    QCOMPARE(outcome.exitCode(), 0);
    QVERIFY(outcome.mailAttempted);
    QVERIFY(outcome.mailed);

    QCOMPARE(m_mailSender.sent.size(), static_cast<size_t>(1));
    const auto &message = m_mailSender.sent.front();
    QCOMPARE(message.to, QStringLiteral("ops@example.org"));
    QCOMPARE(message.from, QStringLiteral("sysreport@nas01"));
    QVERIFY(message.subject.contains(QStringLiteral("nas01")));
    QCOMPARE(message.body, readReport(outcome.path));
    QVERIFY(message.body.contains(QStringLiteral("send e-mail: yes\n")));
}

void CollectorTests::testMailFailureStillSucceeds()
{
    m_mailSender.next = sysreport::MailResult{false, QStringLiteral("connection refused")};

    const auto outcome = runCollector(true);
    QCOMPARE(outcome.exitCode(), 0);
    QVERIFY(outcome.written);
    QVERIFY(outcome.mailAttempted);
    QVERIFY(!outcome.mailed);
    QCOMPARE(outcome.mailError, QStringLiteral("connection refused"));
    QVERIFY(readReport(outcome.path).contains(QStringLiteral("# GROUPS:\n")));
}

void CollectorTests::testNoMatchingDrivesLeavesSmartSectionEmpty()
{
    addDevice(QStringLiteral("nvme0n1"), true);

    const auto outcome = runCollector(false);
    QCOMPARE(outcome.exitCode(), 0);

    const QString text = readReport(outcome.path);
    QVERIFY(text.contains(QStringLiteral("# SMART STATUS:\n\n# RC STATUS:\n")));
    QVERIFY(!text.contains(QStringLiteral("nvme0n1")));
    QCOMPARE(m_runner.callsTo(QStringLiteral("smartctl")), 0);
}

void CollectorTests::testDriveHealthCoversExistingDevicesOnly()
{
    addDevice(QStringLiteral("sda"), true);
    addDevice(QStringLiteral("sdb"), false);
    addDevice(QStringLiteral("nvme0n1"), true);
    const QString sda = m_tempDir->path() + "/dev/sda";
    m_runner.respond(QStringLiteral("smartctl -H ") + sda,
                     QByteArray("SMART overall-health self-assessment test result: PASSED\n"));

    const auto outcome = runCollector(false);
    const QString text = readReport(outcome.path);

    QVERIFY(text.contains(QStringLiteral("== %1 ==\n"
                                         "SMART overall-health self-assessment test result: PASSED\n"
                                         "output of smartctl -i %1\n").arg(sda)));
    QVERIFY(!text.contains(QStringLiteral("/dev/sdb")));
    QVERIFY(!text.contains(QStringLiteral("nvme0n1")));
    QCOMPARE(m_runner.callsTo(QStringLiteral("smartctl")), 2);
}

void CollectorTests::testPublicIpFailureIsMarked()
{
    m_ipLookup.next = sysreport::PublicIpResult{false, QString(), QStringLiteral("timed out after 10000 ms")};

    const auto outcome = runCollector(false);
    QCOMPARE(outcome.exitCode(), 0);
    QCOMPARE(m_ipLookup.calls, 1);
    QCOMPARE(m_ipLookup.lastUrl, m_config.publicIpUrl);
    QVERIFY(readReport(outcome.path).contains(
        QStringLiteral("# EXTERNAL IP ADDRESS:\n"
                       "[unavailable: public IP lookup failed: timed out after 10000 ms]\n")));
}

void CollectorTests::testProbeCommandOverride()
{
    m_config.probeCommands.insert(QStringLiteral("RC STATUS"),
                                  {QStringLiteral("systemctl"), QStringLiteral("list-units")});

    const auto outcome = runCollector(false);
    const QString text = readReport(outcome.path);
    QVERIFY(text.contains(QStringLiteral("# RC STATUS:\noutput of systemctl list-units\n")));
    QCOMPARE(m_runner.callsTo(QStringLiteral("rc-status")), 0);
}

void CollectorTests::testWriteFailureIsFatal()
{
    const QString blocker = m_tempDir->path() + "/blocker";
    QFile file(blocker);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.close();
    m_config.reportDir = blocker + "/reports";

    const auto outcome = runCollector(true);
    QCOMPARE(outcome.exitCode(), 1);
    QVERIFY(!outcome.written);
    QVERIFY(!outcome.error.isEmpty());
    QVERIFY(!outcome.mailAttempted);
    QVERIFY(m_mailSender.sent.empty());
}

void CollectorTests::testSameSecondRunsProduceDistinctFiles()
{
    const auto fixed = sysreport::fromReportStamp("20261019.134501");
    sysreport::ReportCollector collector(m_config, m_runner, m_ipLookup, m_mailSender);
    collector.setClock([fixed]() { return fixed; });

    const auto first = collector.run(false);
    const auto second = collector.run(false);
    QCOMPARE(first.exitCode(), 0);
    QCOMPARE(second.exitCode(), 0);
    QVERIFY(first.path != second.path);
    QVERIFY(first.path.endsWith(QStringLiteral("system_status.20261019.134501")));

    const QStringList files = QDir(m_config.reportDir).entryList(QDir::Files);
    QCOMPARE(files.size(), 2);
}

void CollectorTests::testCompletionLogRecordsMailDelivery()
{
    const auto mailed = runCollector(true);
    QVERIFY(mailed.mailed);
    auto event = lastLogEvent("collection_done");
    QVERIFY(event.is_object());
    QCOMPARE(QString::fromStdString(event["context"].value("path", "")), mailed.path);
    QCOMPARE(event["context"].value("emailed", false), true);

    m_mailSender.next = sysreport::MailResult{false, QStringLiteral("connection refused")};
    const auto failed = runCollector(true);
    QVERIFY(!failed.mailed);
    event = lastLogEvent("collection_done");
    QCOMPARE(QString::fromStdString(event["context"].value("path", "")), failed.path);
    QCOMPARE(event["context"].value("emailed", true), false);
}

QTEST_MAIN(CollectorTests)
#include "test_collector.moc"
