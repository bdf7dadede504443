#pragma once

#include <chrono>

#include <QByteArray>
#include <QString>

#include "common/models.hpp"

namespace sysreport {

struct WriteResult {
    bool ok = false;
    QString path;
    QString error;
};

// "system_status.YYYYMMDD.HHMMSS" in local time.
QString reportFileName(std::chrono::system_clock::time_point timestamp);

QByteArray renderReport(const Report &report);

// Hard-links sourcePath into reportDir under the canonical name for the
// timestamp, or under the first free "-N" variant. Taking the name is atomic,
// so concurrent writers never replace each other's report. Returns the final
// path, or an empty string with *error set.
QString publishReportFile(const QString &sourcePath,
                          const QString &reportDir,
                          std::chrono::system_clock::time_point timestamp,
                          QString *error);

/**
 * Render and persist a report into reportDir (created when missing).
 *
 * The content is written and synced to a temporary file in reportDir, then
 * published with publishReportFile(), so a reader never sees a partial
 * report at the final path. The temporary file is always removed. On success
 * report.path is set.
 */
WriteResult writeReport(const QString &reportDir, Report &report);

} // namespace sysreport
