#include "collector/report_writer.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryFile>

#include <cerrno>
#include <cstring>

#include <unistd.h>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace sysreport {

namespace {

void appendBody(QByteArray &out, const std::string &body)
{
    out += QByteArray::fromStdString(body);
    if (!body.empty() && body.back() != '\n') {
        out += '\n';
    }
}

} // namespace

QString reportFileName(std::chrono::system_clock::time_point timestamp)
{
    return QStringLiteral("system_status.") + QString::fromStdString(toReportStamp(timestamp));
}

QByteArray renderReport(const Report &report)
{
    QByteArray out;
    for (const ReportSection &section : report.sections) {
        const QByteArray label = QByteArray::fromStdString(section.label);
        if (section.style == SectionStyle::Banner) {
            out += label + '\n';
            out += QByteArray(label.size(), '-') + '\n';
        } else {
            out += "# " + label + ":\n";
        }
        appendBody(out, section.body);
        out += '\n';
    }
    return out;
}

QString publishReportFile(const QString &sourcePath,
                          const QString &reportDir,
                          std::chrono::system_clock::time_point timestamp,
                          QString *error)
{
    const QDir dir(reportDir);
    const QString base = reportFileName(timestamp);
    const QByteArray source = QFile::encodeName(sourcePath);
    QString candidate = dir.filePath(base);
    for (int suffix = 1;; ++suffix) {
        // link(2) fails with EEXIST instead of replacing the target.
        if (::link(source.constData(), QFile::encodeName(candidate).constData()) == 0) {
            return candidate;
        }
        if (errno != EEXIST) {
            if (error) {
                *error = QStringLiteral("cannot create %1: %2")
                             .arg(candidate, QString::fromLocal8Bit(std::strerror(errno)));
            }
            return QString();
        }
        candidate = dir.filePath(base + QStringLiteral("-%1").arg(suffix));
    }
}

WriteResult writeReport(const QString &reportDir, Report &report)
{
    WriteResult result;

    if (!QDir().mkpath(reportDir)) {
        result.error = QStringLiteral("cannot create report directory %1").arg(reportDir);
        return result;
    }

    QTemporaryFile file(QDir(reportDir).filePath(QStringLiteral(".system_status.XXXXXX")));
    if (!file.open()) {
        result.error = QStringLiteral("cannot create temporary file in %1: %2")
                           .arg(reportDir, file.errorString());
        return result;
    }

    // The published link shares this inode; QTemporaryFile creates it 0600.
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner
                        | QFileDevice::ReadGroup | QFileDevice::ReadOther);

    const QByteArray content = renderReport(report);
    if (file.write(content) != content.size() || !file.flush()) {
        result.error = QStringLiteral("short write to %1: %2")
                           .arg(file.fileName(), file.errorString());
        return result;
    }
    if (::fsync(file.handle()) != 0) {
        result.error = QStringLiteral("cannot sync %1: %2")
                           .arg(file.fileName(), QString::fromLocal8Bit(std::strerror(errno)));
        return result;
    }

    QString error;
    const QString path = publishReportFile(file.fileName(), reportDir, report.timestamp, &error);
    if (path.isEmpty()) {
        result.error = error;
        return result;
    }
    result.path = path;

    report.path = path.toStdString();
    result.ok = true;

    SYSREPORT_LOG_INFO(QStringLiteral("ReportWriter"),
                       QStringLiteral("writeReport"),
                       QStringLiteral("report_written"),
                       (nlohmann::json{{"path", path.toStdString()},
                                       {"bytes", content.size()},
                                       {"sections", report.sections}}));
    return result;
}

} // namespace sysreport
