#include "common/config.hpp"

#include <QFile>
#include <QFileInfo>
#include <QSysInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/section_labels.hpp"

namespace sysreport {

namespace {

constexpr const char *kSystemConfigPath = "/etc/sysreport/sysreport.json";

QString stringValue(const nlohmann::json &object, const char *key, const QString &fallback)
{
    if (!object.contains(key)) {
        return fallback;
    }
    return QString::fromStdString(object.at(key).get<std::string>());
}

QStringList stringListValue(const nlohmann::json &value)
{
    QStringList result;
    for (const auto &item : value.get<std::vector<std::string>>()) {
        result.push_back(QString::fromStdString(item));
    }
    return result;
}

void overrideFromEnv(QString &target, const char *name)
{
    const QString value = qEnvironmentVariable(name);
    if (!value.isEmpty()) {
        target = value;
    }
}

} // namespace

Config defaultConfig()
{
    Config config;
    config.hostname = QSysInfo::machineHostName();
    config.recipient = QStringLiteral("root@localhost");
    config.reportDir = QStringLiteral("/var/log/sysreport");
    config.publicIpUrl = QStringLiteral("https://ifconfig.co/ip");
    config.mailCommand = {QStringLiteral("/usr/sbin/sendmail"), QStringLiteral("-t")};
    config.blockDeviceDir = QStringLiteral("/sys/block");
    config.deviceNodeDir = QStringLiteral("/dev");
    config.devicePatterns = {QStringLiteral("sd*")};
    return config;
}

QString resolveConfigPath(const QString &explicitPath)
{
    if (!explicitPath.isEmpty()) {
        return explicitPath;
    }
    const QString fromEnv = qEnvironmentVariable("SYSREPORT_CONFIG");
    if (!fromEnv.isEmpty()) {
        return fromEnv;
    }
    const QString systemPath = QString::fromLatin1(kSystemConfigPath);
    if (QFileInfo::exists(systemPath)) {
        return systemPath;
    }
    return QString();
}

std::optional<Config> loadConfigFile(const QString &path, const Config &base,
                                     QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QStringLiteral("cannot read config file %1: %2")
                         .arg(path, file.errorString());
        }
        return std::nullopt;
    }
    const QByteArray data = file.readAll();

    Config config = base;
    try {
        const nlohmann::json root = nlohmann::json::parse(data.toStdString());
        if (!root.is_object()) {
            if (error) {
                *error = QStringLiteral("config file %1 must contain a JSON object").arg(path);
            }
            return std::nullopt;
        }

        config.hostname = stringValue(root, "hostname", config.hostname);
        config.recipient = stringValue(root, "recipient", config.recipient);
        config.sender = stringValue(root, "sender", config.sender);
        config.reportDir = stringValue(root, "report_dir", config.reportDir);
        config.publicIpUrl = stringValue(root, "public_ip_url", config.publicIpUrl);
        config.blockDeviceDir = stringValue(root, "block_device_dir", config.blockDeviceDir);
        config.deviceNodeDir = stringValue(root, "device_node_dir", config.deviceNodeDir);
        config.networkTimeoutMs = root.value("network_timeout_ms", config.networkTimeoutMs);
        config.probeTimeoutMs = root.value("probe_timeout_ms", config.probeTimeoutMs);
        if (root.contains("mail_command")) {
            config.mailCommand = stringListValue(root.at("mail_command"));
        }
        if (root.contains("device_patterns")) {
            config.devicePatterns = stringListValue(root.at("device_patterns"));
        }
        if (root.contains("probe_commands")) {
            const auto &commands = root.at("probe_commands");
            if (!commands.is_object()) {
                if (error) {
                    *error = QStringLiteral("probe_commands in %1 must be an object").arg(path);
                }
                return std::nullopt;
            }
            for (const auto &item : commands.items()) {
                config.probeCommands.insert(QString::fromStdString(item.key()),
                                            stringListValue(item.value()));
            }
        }
    } catch (const nlohmann::json::parse_error &ex) {
        if (error) {
            *error = QStringLiteral("malformed config file %1: %2")
                         .arg(path, QString::fromUtf8(ex.what()));
        }
        return std::nullopt;
    } catch (const nlohmann::json::type_error &ex) {
        if (error) {
            *error = QStringLiteral("invalid value in config file %1: %2")
                         .arg(path, QString::fromUtf8(ex.what()));
        }
        return std::nullopt;
    }

    config.sourcePath = path;
    return config;
}

void applyEnvironment(Config &config)
{
    overrideFromEnv(config.hostname, "SYSREPORT_HOSTNAME");
    overrideFromEnv(config.recipient, "SYSREPORT_RECIPIENT");
    overrideFromEnv(config.sender, "SYSREPORT_SENDER");
    overrideFromEnv(config.reportDir, "SYSREPORT_REPORT_DIR");
    overrideFromEnv(config.publicIpUrl, "SYSREPORT_PUBLIC_IP_URL");
}

void resolveDerivedDefaults(Config &config)
{
    if (config.hostname.isEmpty()) {
        config.hostname = QStringLiteral("localhost");
    }
    if (config.sender.isEmpty()) {
        config.sender = QStringLiteral("sysreport@") + config.hostname;
    }
}

QString validateConfig(const Config &config)
{
    if (config.reportDir.isEmpty()) {
        return QStringLiteral("report directory must not be empty");
    }
    if (config.recipient.isEmpty()) {
        return QStringLiteral("mail recipient must not be empty");
    }
    if (config.networkTimeoutMs <= 0) {
        return QStringLiteral("network_timeout_ms must be positive");
    }
    if (config.probeTimeoutMs <= 0) {
        return QStringLiteral("probe_timeout_ms must be positive");
    }
    if (config.mailCommand.isEmpty() || config.mailCommand.first().isEmpty()) {
        return QStringLiteral("mail_command must name a program");
    }
    for (auto it = config.probeCommands.cbegin(); it != config.probeCommands.cend(); ++it) {
        if (!labels::all().contains(it.key())) {
            return QStringLiteral("probe_commands names unknown section \"%1\"").arg(it.key());
        }
        if (!labels::acceptsCommandOverride(it.key())) {
            return QStringLiteral("section \"%1\" does not run a configurable command")
                .arg(it.key());
        }
        if (it.value().isEmpty()) {
            return QStringLiteral("probe command for \"%1\" is empty").arg(it.key());
        }
    }
    return QString();
}

std::optional<Config> loadConfig(const QString &explicitPath, QString *error)
{
    Config config = defaultConfig();

    const QString path = resolveConfigPath(explicitPath);
    if (!path.isEmpty()) {
        auto loaded = loadConfigFile(path, config, error);
        if (!loaded.has_value()) {
            return std::nullopt;
        }
        config = *loaded;
    }

    applyEnvironment(config);

    SYSREPORT_LOG_DEBUG(QStringLiteral("Config"),
                        QStringLiteral("loadConfig"),
                        QStringLiteral("config_loaded"),
                        (nlohmann::json{{"source", config.sourcePath.toStdString()},
                                        {"reportDir", config.reportDir.toStdString()}}));
    return config;
}

} // namespace sysreport
