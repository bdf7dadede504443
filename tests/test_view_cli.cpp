#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "viewer/ViewCli.hpp"

namespace {

QByteArray reportText(const char *date, const char *time, int usedMemory)
{
    return QByteArray("STATUS INFORMATION\n"
                      "------------------\n"
                      "date: ") + date + "\n"
        + "time: " + time + "\n"
        + "hostname: nas01\n"
          "send e-mail: no\n"
          "\n"
          "# MEMORY:\n"
          "              total        used        free\n"
          "Mem:        8052224     " + QByteArray::number(usedMemory) + "     5120000\n"
          "\n"
          "# USERS:\n"
          "root\n"
          "\n";
}

} // namespace

class ViewCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testSectionsListsNewestReport();
    void testTableJsonMarksChanges();
    void testTableMarkdown();
    void testUnknownSectionFails();
    void testShowFile();
    void testMissingDirectoryFails();

private:
    QTemporaryDir m_tempDir;

    QString reportDir() const;
    int runCli(const QStringList &args, std::string &out);
};

void ViewCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("SYSREPORT_LOG_DIR", (m_tempDir.path() + "/logs").toUtf8());

    QVERIFY(QDir().mkpath(reportDir()));
    QFile older(reportDir() + "/system_status.20261018.080000");
    QVERIFY(older.open(QIODevice::WriteOnly));
    older.write(reportText("2026-10-18", "08:00:00", 1000000));
    older.close();

    QFile newer(reportDir() + "/system_status.20261019.080000");
    QVERIFY(newer.open(QIODevice::WriteOnly));
    newer.write(reportText("2026-10-19", "08:00:00", 2000000));
    newer.close();
}

QString ViewCliTests::reportDir() const
{
    return m_tempDir.path() + "/reports";
}

int ViewCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    sysreport::ViewCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void ViewCliTests::testSectionsListsNewestReport()
{
    std::string output;
    const int code = runCli({"sysreport-view", "sections", "--dir", reportDir()}, output);
    QCOMPARE(code, 0);
    QCOMPARE(output, std::string("STATUS INFORMATION\nMEMORY\nUSERS\n"));
}

void ViewCliTests::testTableJsonMarksChanges()
{
    std::string output;
    const int code = runCli({"sysreport-view", "table", "--dir", reportDir(),
                             "--section", "MEMORY", "--format", "json"}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("section").get<std::string>(), std::string("MEMORY"));
    const auto &rows = parsed.at("rows");
    QCOMPARE(rows.size(), static_cast<size_t>(2));
    QCOMPARE(rows[0].at("timestamp").get<std::string>(), std::string("2026-10-19 08:00:00"));
    QCOMPARE(rows[0].at("cells").at("Mem - used").get<std::string>(), std::string("2000000"));
    QVERIFY(rows[0].at("changed") == nlohmann::json::array({"Mem - used"}));
    QVERIFY(rows[1].at("changed").empty());
}

void ViewCliTests::testTableMarkdown()
{
    std::string output;
    const int code = runCli({"sysreport-view", "table", "--dir", reportDir(),
                             "--section", "USERS"}, output);
    QCOMPARE(code, 0);
    QVERIFY(output.find("# USERS") == 0);
    QVERIFY(output.find("| timestamp | 0 |") != std::string::npos);
    QVERIFY(output.find("| 2026-10-19 08:00:00 | root |") != std::string::npos);
}

void ViewCliTests::testUnknownSectionFails()
{
    std::string output;
    const int code = runCli({"sysreport-view", "table", "--dir", reportDir(),
                             "--section", "NO SUCH SECTION"}, output);
    QCOMPARE(code, 1);
    QVERIFY(output.find("Section not found") != std::string::npos);
}

void ViewCliTests::testShowFile()
{
    std::string output;
    const int code = runCli({"sysreport-view", "show", "--file",
                             reportDir() + "/system_status.20261018.080000"}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("hostname").get<std::string>(), std::string("nas01"));
    QCOMPARE(parsed.at("sections").size(), static_cast<size_t>(3));
    QCOMPARE(parsed.at("sections")[1].at("fields").at("Mem - used").get<int>(), 1000000);
}

void ViewCliTests::testMissingDirectoryFails()
{
    std::string output;
    const int code = runCli({"sysreport-view", "sections", "--dir",
                             m_tempDir.path() + "/missing"}, output);
    QCOMPARE(code, 1);
}

QTEST_MAIN(ViewCliTests)
#include "test_view_cli.moc"
