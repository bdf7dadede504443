#include "viewer/ViewCli.hpp"

#include <iostream>

#include <QDir>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "viewer/comparison_table.hpp"
#include "viewer/report_parser.hpp"

namespace sysreport {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  sysreport-view sections --dir DIR\n"
        "  sysreport-view table --dir DIR --section NAME [--format markdown|json]\n"
        "  sysreport-view show --file PATH\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const qsizetype idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

} // namespace

int ViewCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    SYSREPORT_LOG_INFO(QStringLiteral("ViewCli"),
                       QStringLiteral("run"),
                       QStringLiteral("view_cli_command"),
                       (nlohmann::json{{"command", command.toStdString()}}));
    if (command == QStringLiteral("sections")) {
        return runSections(args);
    }
    if (command == QStringLiteral("table")) {
        return runTable(args);
    }
    if (command == QStringLiteral("show")) {
        return runShow(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ViewCli::runSections(const QStringList &args)
{
    const QString dir = getArgValue(args, QStringLiteral("--dir"));
    if (dir.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (!QDir(dir).exists()) {
        std::cerr << "Report directory does not exist." << std::endl;
        return 1;
    }

    const auto reports = loadReports(dir);
    if (reports.empty()) {
        std::cerr << "No reports found." << std::endl;
        return 1;
    }

    for (const std::string &name : sectionNames(reports.front())) {
        std::cout << name << "\n";
    }
    return 0;
}

int ViewCli::runTable(const QStringList &args)
{
    const QString dir = getArgValue(args, QStringLiteral("--dir"));
    const QString section = getArgValue(args, QStringLiteral("--section"));
    if (dir.isEmpty() || section.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = getFormat(args);
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }
    if (!QDir(dir).exists()) {
        std::cerr << "Report directory does not exist." << std::endl;
        return 1;
    }

    const auto reports = loadReports(dir);
    const ComparisonTable table = buildComparisonTable(reports, section.toStdString());
    if (table.columns.empty()) {
        std::cerr << "Section not found: " << section.toStdString() << std::endl;
        return 1;
    }

    SYSREPORT_LOG_INFO(QStringLiteral("ViewCli"),
                       QStringLiteral("runTable"),
                       QStringLiteral("view_table"),
                       (nlohmann::json{{"section", section.toStdString()},
                                       {"reports", reports.size()},
                                       {"format", format.toStdString()}}));
    if (format == QStringLiteral("json")) {
        std::cout << tableToJson(table).dump(2) << std::endl;
    } else {
        std::cout << renderTableMarkdown(table);
    }
    return 0;
}

int ViewCli::runShow(const QStringList &args)
{
    const QString path = getArgValue(args, QStringLiteral("--file"));
    if (path.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    QString error;
    const auto report = parseReportFile(path, &error);
    if (!report.has_value()) {
        std::cerr << error.toStdString() << std::endl;
        return 1;
    }

    std::cout << nlohmann::ordered_json(*report).dump(2) << std::endl;
    return 0;
}

} // namespace sysreport
