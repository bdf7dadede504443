#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace sysreport {

struct ComparisonRow {
    std::string timestamp;
    std::string path;
    // Parallel to ComparisonTable::columns; empty when the report lacks it.
    std::vector<std::string> cells;
    // Per column: value differs from the next older row.
    std::vector<bool> changed;
};

struct ComparisonTable {
    std::string section;
    std::vector<std::string> columns;
    std::vector<ComparisonRow> rows;
};

// Reports must be sorted newest first. Columns come from the newest report
// that has the section; sections without extracted fields get a single
// "lines" column holding their line count.
ComparisonTable buildComparisonTable(const std::vector<ParsedReport> &reports,
                                     const std::string &sectionName);

// Distinct section display names of a report, in report order.
std::vector<std::string> sectionNames(const ParsedReport &report);

std::string renderTableMarkdown(const ComparisonTable &table);

nlohmann::ordered_json tableToJson(const ComparisonTable &table);

} // namespace sysreport
