#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace sysreport::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool verbose);

bool isVerbose();

// Directory the JSON-lines log files are written to.
QString logsDirPath();

// Structured log event, one JSON object per line.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

} // namespace sysreport::logging

#define SYSREPORT_LOG_DEBUG(component, where, what, ctxJson) \
    ::sysreport::logging::logEvent(::sysreport::logging::LogLevel::Debug, \
                                   (component), (where), (what), (ctxJson))

#define SYSREPORT_LOG_INFO(component, where, what, ctxJson) \
    ::sysreport::logging::logEvent(::sysreport::logging::LogLevel::Info, \
                                   (component), (where), (what), (ctxJson))

#define SYSREPORT_LOG_WARN(component, where, what, ctxJson) \
    ::sysreport::logging::logEvent(::sysreport::logging::LogLevel::Warn, \
                                   (component), (where), (what), (ctxJson))

#define SYSREPORT_LOG_ERROR(component, where, what, ctxJson) \
    ::sysreport::logging::logEvent(::sysreport::logging::LogLevel::Error, \
                                   (component), (where), (what), (ctxJson))
