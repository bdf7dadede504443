#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <cstdio>
#include <mutex>

namespace sysreport::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_verbose = false;
QString g_processName;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString logFilePath(const QString &processName)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("sysreport")
        : processName;
    return logsDirPath() + QDir::separator() + base + QStringLiteral(".log");
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const QString &path, const QString &line)
{
    QDir().mkpath(logsDirPath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

} // namespace

void initLogging(const QString &processName, bool verbose)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_verbose = verbose;
}

bool isVerbose()
{
    return g_verbose;
}

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("SYSREPORT_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/sysreport/logs");
    }
    return home + QStringLiteral("/.local/share/sysreport/logs");
}

QString defaultProcessName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("sysreport");
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !g_verbose) {
        return;
    }

    const QString process = defaultProcessName();
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"context", context}
    };

    const QString line = QString::fromStdString(payload.dump());

    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine(logFilePath(process), line);
}

} // namespace sysreport::logging
