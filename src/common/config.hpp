#pragma once

#include <optional>

#include <QHash>
#include <QString>
#include <QStringList>

namespace sysreport {

/**
 * Runtime configuration for the collector.
 *
 * Values are layered: built-in defaults, then the JSON config file, then
 * SYSREPORT_* environment variables, then command-line flags (applied by the
 * caller). Call resolveDerivedDefaults() once all layers are applied.
 */
struct Config {
    QString hostname;
    QString recipient;
    // Empty means "sysreport@<hostname>".
    QString sender;
    QString reportDir;
    QString publicIpUrl;
    int networkTimeoutMs = 10000;
    int probeTimeoutMs = 60000;
    QStringList mailCommand;
    QString blockDeviceDir;
    QString deviceNodeDir;
    QStringList devicePatterns;
    // Section label -> argv replacing the built-in command of that probe.
    QHash<QString, QStringList> probeCommands;
    // Config file the values were read from; empty when none was used.
    QString sourcePath;
};

Config defaultConfig();

// --config value, else SYSREPORT_CONFIG, else the system path if present.
QString resolveConfigPath(const QString &explicitPath);

// Overlays the JSON file at path onto base. Returns std::nullopt and sets
// error when the file cannot be read or holds invalid values.
std::optional<Config> loadConfigFile(const QString &path, const Config &base,
                                     QString *error);

void applyEnvironment(Config &config);

void resolveDerivedDefaults(Config &config);

// Returns an empty string when the config is usable.
QString validateConfig(const Config &config);

// Defaults + file (if any) + environment.
std::optional<Config> loadConfig(const QString &explicitPath, QString *error);

} // namespace sysreport
