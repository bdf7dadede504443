#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace sysreport {

/**
 * Split report text into sections and extract per-section fields.
 *
 * A section starts at a banner title line (STATUS INFORMATION, ACCESS
 * INFORMATION, UPGRADABLE PACKAGES) or at a "# NAME:" line. Sections with
 * repeated records (CPU, NETWORK, DISKS, ZFS POOLS) yield one ParsedSection
 * per record, distinguished by ParsedSection::instance.
 *
 * path is only used to recover the timestamp from the file name when the
 * STATUS INFORMATION block carries no date/time.
 */
ParsedReport parseReportText(const QString &text, const QString &path = QString());

std::optional<ParsedReport> parseReportFile(const QString &path, QString *error);

// All system_status.* files below dir, parsed, newest first. Files that
// cannot be read are skipped.
std::vector<ParsedReport> loadReports(const QString &dir);

// instance when set, otherwise name.
std::string sectionDisplayName(const ParsedSection &section);

} // namespace sysreport
