#pragma once

#include <chrono>
#include <functional>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "common/models.hpp"
#include "common/process_utils.hpp"
#include "collector/public_ip.hpp"

namespace sysreport {

// A probe is a labeled producer of section text. Producers never fail; when
// their source is unavailable they return a "[unavailable: ...]" marker.
struct ProbeDefinition {
    QString label;
    SectionStyle style = SectionStyle::Module;
    std::function<QString()> produce;
};

// Everything a probe may read. Must outlive the catalog built from it.
struct ProbeContext {
    const Config &config;
    CommandRunner &runner;
    PublicIpLookup &ipLookup;
    std::chrono::system_clock::time_point timestamp;
    bool sendMail = false;
};

/**
 * Build the fixed, ordered probe list (see labels::all()).
 *
 * Command-backed probes use Config::probeCommands[label] in place of their
 * built-in command when present.
 */
std::vector<ProbeDefinition> buildProbeCatalog(const ProbeContext &context);

// Built-in argv lists of a command-backed section, in execution order.
std::vector<QStringList> defaultProbeCommands(const QString &label);

// Runs one command and returns its stdout as text, or stdout followed by a
// marker line when it could not start or timed out.
QString captureCommand(CommandRunner &runner, const QStringList &argv, int timeoutMs);

// Health summary and identity of every discovered device matching the
// configured patterns, each under a "== /dev/<name> ==" line.
QString collectDriveHealth(const Config &config, CommandRunner &runner);

ReportSection evaluateProbe(const ProbeDefinition &probe);

} // namespace sysreport
