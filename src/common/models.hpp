#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace sysreport {

struct ReportSection {
    std::string label;
    SectionStyle style = SectionStyle::Module;
    std::string body;
};

struct Report {
    std::chrono::system_clock::time_point timestamp;
    std::string hostname;
    std::vector<ReportSection> sections;
    std::string path;
    bool emailed = false;
};

struct ParsedSection {
    std::string name;
    // Distinguishes repeated records of one section, e.g. "CPU - 0".
    std::string instance;
    std::vector<std::string> lines;
    nlohmann::ordered_json fields = nlohmann::ordered_json::object();
};

struct ParsedReport {
    std::string path;
    std::chrono::system_clock::time_point timestamp;
    std::string hostname;
    std::vector<ParsedSection> sections;
};

} // namespace sysreport
