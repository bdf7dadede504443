#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace sysreport {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Formats a local-time timestamp with the given strftime pattern.
inline std::string formatLocalTime(std::chrono::system_clock::time_point timestamp,
                                   const char *pattern)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, pattern);
    return out.str();
}

// File-name stamp, e.g. "20261019.134501".
inline std::string toReportStamp(std::chrono::system_clock::time_point timestamp)
{
    return formatLocalTime(timestamp, "%Y%m%d.%H%M%S");
}

// Returns a default-constructed time_point when the value does not parse.
inline std::chrono::system_clock::time_point fromLocalTime(const std::string &value,
                                                          const char *pattern)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, pattern);
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    tm.tm_isdst = -1;
    std::time_t time = std::mktime(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::chrono::system_clock::time_point fromReportStamp(const std::string &value)
{
    return fromLocalTime(value, "%Y%m%d.%H%M%S");
}

inline std::string toSectionStyleString(SectionStyle style)
{
    switch (style) {
    case SectionStyle::Banner:
        return "banner";
    case SectionStyle::Module:
        return "module";
    }
    return "module";
}

inline void to_json(nlohmann::ordered_json &j, const ParsedSection &section)
{
    j = nlohmann::ordered_json{
        {"name", section.name},
        {"instance", section.instance},
        {"fields", section.fields},
        {"lines", section.lines}
    };
}

inline void to_json(nlohmann::ordered_json &j, const ParsedReport &report)
{
    j = nlohmann::ordered_json{
        {"path", report.path},
        {"timestamp", toIso8601Utc(report.timestamp)},
        {"hostname", report.hostname},
        {"sections", report.sections}
    };
}

inline void to_json(nlohmann::json &j, const ReportSection &section)
{
    j = nlohmann::json{
        {"label", section.label},
        {"style", toSectionStyleString(section.style)},
        {"bytes", section.body.size()}
    };
}

} // namespace sysreport
