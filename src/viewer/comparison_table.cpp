#include "viewer/comparison_table.hpp"

#include <algorithm>
#include <sstream>

#include "common/json_utils.hpp"
#include "viewer/report_parser.hpp"

namespace sysreport {

namespace {

const ParsedSection *findSection(const ParsedReport &report, const std::string &name)
{
    for (const ParsedSection &section : report.sections) {
        if (sectionDisplayName(section) == name) {
            return &section;
        }
    }
    return nullptr;
}

std::string cellText(const nlohmann::ordered_json &value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "yes" : "no";
    }
    if (value.is_null()) {
        return std::string();
    }
    return value.dump();
}

std::string escapeCell(const std::string &value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (const char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else {
            escaped += ch;
        }
    }
    return escaped;
}

} // namespace

std::vector<std::string> sectionNames(const ParsedReport &report)
{
    std::vector<std::string> names;
    for (const ParsedSection &section : report.sections) {
        const std::string name = sectionDisplayName(section);
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

ComparisonTable buildComparisonTable(const std::vector<ParsedReport> &reports,
                                     const std::string &sectionName)
{
    ComparisonTable table;
    table.section = sectionName;

    bool rawOnly = false;
    for (const ParsedReport &report : reports) {
        const ParsedSection *section = findSection(report, sectionName);
        if (section == nullptr) {
            continue;
        }
        for (const auto &item : section->fields.items()) {
            table.columns.push_back(item.key());
        }
        if (table.columns.empty()) {
            table.columns.push_back("lines");
            rawOnly = true;
        }
        break;
    }

    for (const ParsedReport &report : reports) {
        ComparisonRow row;
        row.timestamp = formatLocalTime(report.timestamp, "%Y-%m-%d %H:%M:%S");
        row.path = report.path;
        const ParsedSection *section = findSection(report, sectionName);
        for (const std::string &column : table.columns) {
            if (section == nullptr) {
                row.cells.emplace_back();
            } else if (rawOnly) {
                row.cells.push_back(std::to_string(section->lines.size()));
            } else if (section->fields.contains(column)) {
                row.cells.push_back(cellText(section->fields.at(column)));
            } else {
                row.cells.emplace_back();
            }
        }
        row.changed.assign(table.columns.size(), false);
        table.rows.push_back(std::move(row));
    }

    for (size_t i = 0; i + 1 < table.rows.size(); ++i) {
        auto &row = table.rows[i];
        const auto &older = table.rows[i + 1];
        for (size_t c = 0; c < table.columns.size(); ++c) {
            row.changed[c] = row.cells[c] != older.cells[c];
        }
    }
    return table;
}

std::string renderTableMarkdown(const ComparisonTable &table)
{
    std::ostringstream out;
    out << "# " << table.section << "\n\n";
    if (table.rows.empty() || table.columns.empty()) {
        out << "No reports contain this section.\n";
        return out.str();
    }

    out << "| timestamp |";
    for (const std::string &column : table.columns) {
        out << " " << escapeCell(column) << " |";
    }
    out << "\n|---|";
    for (size_t c = 0; c < table.columns.size(); ++c) {
        out << "---|";
    }
    out << "\n";

    for (const ComparisonRow &row : table.rows) {
        out << "| " << row.timestamp << " |";
        for (size_t c = 0; c < row.cells.size(); ++c) {
            const std::string value = row.cells[c].empty() ? "-" : escapeCell(row.cells[c]);
            if (row.changed[c]) {
                out << " **" << value << "** |";
            } else {
                out << " " << value << " |";
            }
        }
        out << "\n";
    }
    return out.str();
}

nlohmann::ordered_json tableToJson(const ComparisonTable &table)
{
    nlohmann::ordered_json payload;
    payload["section"] = table.section;
    payload["columns"] = table.columns;
    payload["rows"] = nlohmann::ordered_json::array();
    for (const ComparisonRow &row : table.rows) {
        nlohmann::ordered_json cells = nlohmann::ordered_json::object();
        nlohmann::ordered_json changed = nlohmann::ordered_json::array();
        for (size_t c = 0; c < table.columns.size(); ++c) {
            cells[table.columns[c]] = row.cells[c];
            if (row.changed[c]) {
                changed.push_back(table.columns[c]);
            }
        }
        payload["rows"].push_back(nlohmann::ordered_json{
            {"timestamp", row.timestamp},
            {"path", row.path},
            {"cells", cells},
            {"changed", changed}
        });
    }
    return payload;
}

} // namespace sysreport
