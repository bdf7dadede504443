#include "viewer/report_parser.hpp"

#include <algorithm>

#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/section_labels.hpp"

namespace sysreport {

namespace {

struct RawSection {
    QString name;
    QStringList lines;
};

std::optional<QString> detectHeader(const QString &line)
{
    const QString trimmed = line.trimmed();
    if (labels::isBanner(trimmed)) {
        return trimmed;
    }
    if (line.startsWith(QStringLiteral("# "))) {
        QString name = line.mid(2);
        name.remove(QLatin1Char(':'));
        return name.trimmed();
    }
    return std::nullopt;
}

bool isUnderline(const QString &line)
{
    static const QRegularExpression pattern(QStringLiteral("^-+$"));
    return pattern.match(line.trimmed()).hasMatch();
}

bool isMarker(const QString &line)
{
    return line.trimmed().startsWith(QStringLiteral("[unavailable:"));
}

// "key: value" split at the first colon. The value may itself contain colons.
std::pair<QString, QString> splitKeyValue(const QString &line)
{
    const qsizetype colon = line.indexOf(QLatin1Char(':'));
    if (colon < 0) {
        return {line.trimmed(), QString()};
    }
    return {line.left(colon).trimmed(), line.mid(colon + 1).trimmed()};
}

QStringList tokens(const QString &line)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    return line.trimmed().split(whitespace, Qt::SkipEmptyParts);
}

ParsedSection makeSection(const QString &name, const QString &instance = QString())
{
    ParsedSection section;
    section.name = name.toStdString();
    section.instance = instance.isEmpty()
        ? std::string()
        : (name + QStringLiteral(" - ") + instance).toStdString();
    return section;
}

void extractStatus(const RawSection &raw, ParsedSection &section)
{
    for (const QString &line : raw.lines) {
        const auto [key, value] = splitKeyValue(line);
        if (key.isEmpty() || value.isEmpty()) {
            continue;
        }
        if (key == QStringLiteral("send e-mail")) {
            section.fields[key.toStdString()] = value == QStringLiteral("yes");
        } else {
            section.fields[key.toStdString()] = value.toStdString();
        }
    }
}

void extractCpu(const RawSection &raw, std::vector<ParsedSection> &out)
{
    ParsedSection *current = nullptr;
    for (const QString &line : raw.lines) {
        const auto [key, value] = splitKeyValue(line);
        if (key == QStringLiteral("processor") || current == nullptr) {
            out.push_back(makeSection(raw.name, key == QStringLiteral("processor") ? value : QString()));
            current = &out.back();
        }
        current->lines.push_back(line.toStdString());
        if (!key.isEmpty()) {
            current->fields[key.toStdString()] = value.toStdString();
        }
    }
}

void extractMemory(const RawSection &raw, ParsedSection &section)
{
    static const QStringList memColumns = {
        QStringLiteral("total"), QStringLiteral("used"), QStringLiteral("free"),
        QStringLiteral("shared"), QStringLiteral("buff/cache"), QStringLiteral("available")};
    static const QStringList swapColumns = {
        QStringLiteral("total"), QStringLiteral("used"), QStringLiteral("free")};

    for (const QString &line : raw.lines) {
        const QStringList parts = tokens(line);
        if (parts.isEmpty()) {
            continue;
        }
        const QStringList *columns = nullptr;
        QString prefix;
        if (parts.first().startsWith(QStringLiteral("Mem"))) {
            columns = &memColumns;
            prefix = QStringLiteral("Mem");
        } else if (parts.first().startsWith(QStringLiteral("Swap"))) {
            columns = &swapColumns;
            prefix = QStringLiteral("Swap");
        } else {
            continue;
        }
        for (qsizetype i = 0; i < columns->size() && i + 1 < parts.size(); ++i) {
            bool ok = false;
            const qlonglong number = parts.at(i + 1).toLongLong(&ok);
            const std::string key = (prefix + QStringLiteral(" - ") + columns->at(i)).toStdString();
            if (ok) {
                section.fields[key] = number;
            } else {
                section.fields[key] = parts.at(i + 1).toStdString();
            }
        }
    }
}

void extractNetwork(const RawSection &raw, std::vector<ParsedSection> &out)
{
    static const QRegularExpression interfaceLine(QStringLiteral("^(\\d+):\\s*([^:\\s]+)"));
    ParsedSection *current = nullptr;
    for (const QString &line : raw.lines) {
        const auto match = interfaceLine.match(line);
        if (match.hasMatch()) {
            const QString name = match.captured(2);
            out.push_back(makeSection(raw.name, name));
            current = &out.back();
            current->fields["index"] = match.captured(1).toInt();
            current->fields["name"] = name.toStdString();
            current->lines.push_back(line.toStdString());
            continue;
        }
        if (current == nullptr) {
            out.push_back(makeSection(raw.name));
            current = &out.back();
        }
        current->lines.push_back(line.toStdString());
        const QStringList parts = tokens(line);
        if (parts.size() < 2) {
            continue;
        }
        if (parts.first() == QStringLiteral("inet") && !current->fields.contains("inet")) {
            current->fields["inet"] = parts.at(1).toStdString();
        } else if (parts.first() == QStringLiteral("inet6")
                   && !current->fields.contains("inet6")) {
            current->fields["inet6"] = parts.at(1).toStdString();
        }
    }
}

QString stripTreeGlyphs(QString value)
{
    // Leading tree drawing, Unicode or ASCII ("|-", "`-").
    static const QRegularExpression glyphs(QStringLiteral("^[├└│─`|\\s-]+"));
    return value.remove(glyphs);
}

void extractDisks(const RawSection &raw, std::vector<ParsedSection> &out)
{
    for (const QString &line : raw.lines) {
        if (line.trimmed().startsWith(QStringLiteral("NAME")) || isMarker(line)) {
            continue;
        }
        const QStringList parts = tokens(line);
        if (parts.size() < 5) {
            continue;
        }
        const QString name = stripTreeGlyphs(parts.at(0));
        ParsedSection section = makeSection(raw.name, name);
        section.lines.push_back(line.toStdString());
        section.fields["name"] = name.toStdString();
        section.fields["size"] = parts.at(3).toStdString();
        section.fields["ro"] = parts.at(4).toStdString();

        // FSTYPE, MOUNTPOINT and UUID may each be blank; a mount point is the
        // only one starting with '/'.
        QString fstype;
        QString mountpoint;
        QString uuid;
        const QStringList rest = parts.mid(5);
        if (rest.size() >= 3) {
            fstype = rest.at(0);
            mountpoint = rest.at(1);
            uuid = rest.at(2);
        } else if (rest.size() == 2) {
            fstype = rest.at(0);
            if (rest.at(1).startsWith(QLatin1Char('/'))) {
                mountpoint = rest.at(1);
            } else {
                uuid = rest.at(1);
            }
        } else if (rest.size() == 1) {
            if (rest.at(0).startsWith(QLatin1Char('/'))) {
                mountpoint = rest.at(0);
            } else {
                fstype = rest.at(0);
            }
        }
        section.fields["fstype"] = fstype.toStdString();
        section.fields["mountpoint"] = mountpoint.toStdString();
        section.fields["uuid"] = uuid.toStdString();
        out.push_back(std::move(section));
    }
}

void extractMount(const RawSection &raw, ParsedSection &section)
{
    for (const QString &line : raw.lines) {
        const QStringList parts = tokens(line);
        // "<device> on <mountpoint> type <fstype> (<options>)"
        const QString key = parts.size() >= 3 && parts.at(1) == QStringLiteral("on")
            ? parts.at(2)
            : parts.value(0);
        if (!key.isEmpty()) {
            section.fields[key.toStdString()] = line.trimmed().toStdString();
        }
    }
}

void extractZfsPools(const RawSection &raw, std::vector<ParsedSection> &out)
{
    static const QStringList columns = {
        QStringLiteral("name"), QStringLiteral("size"), QStringLiteral("alloc"),
        QStringLiteral("free"), QStringLiteral("ckpoint"), QStringLiteral("expandsz"),
        QStringLiteral("frag"), QStringLiteral("cap"), QStringLiteral("dedup"),
        QStringLiteral("health"), QStringLiteral("altroot")};

    for (const QString &line : raw.lines) {
        const QStringList parts = tokens(line);
        if (parts.size() != columns.size() || parts.first() == QStringLiteral("NAME")) {
            continue;
        }
        ParsedSection section = makeSection(raw.name, parts.first());
        section.lines.push_back(line.toStdString());
        for (qsizetype i = 0; i < columns.size(); ++i) {
            const QString value = parts.at(i) == QStringLiteral("-") ? QString() : parts.at(i);
            section.fields[columns.at(i).toStdString()] = value.toStdString();
        }
        out.push_back(std::move(section));
    }
}

void extractRcStatus(const RawSection &raw, ParsedSection &section)
{
    static const QRegularExpression state(QStringLiteral("\\[\\s*([^\\]]*?)\\s*\\]"));
    for (const QString &line : raw.lines) {
        if (isMarker(line)) {
            continue;
        }
        if (line.contains(QStringLiteral("Runlevel:"))) {
            const QString level = line.mid(line.indexOf(QLatin1Char(':')) + 1).trimmed();
            section.fields[level.toUpper().toStdString()] = "";
            continue;
        }
        const QStringList parts = tokens(line);
        if (parts.isEmpty()) {
            continue;
        }
        const auto match = state.match(line);
        section.fields[parts.first().toStdString()] =
            match.hasMatch() ? match.captured(1).toStdString() : std::string();
    }
}

void extractUpgradable(const RawSection &raw, ParsedSection &section)
{
    int packages = 0;
    for (const QString &line : raw.lines) {
        if (line.startsWith(QStringLiteral("Installed")) || line.startsWith(QLatin1Char('-'))
            || isMarker(line)) {
            continue;
        }
        ++packages;
    }
    section.fields["count"] = packages > 0 ? std::to_string(packages) : std::string();
}

void extractIndexed(const RawSection &raw, ParsedSection &section)
{
    int index = 0;
    for (const QString &line : raw.lines) {
        if (isMarker(line)) {
            continue;
        }
        section.fields[std::to_string(index++)] = line.trimmed().toStdString();
    }
}

void appendParsed(const RawSection &raw, std::vector<ParsedSection> &out)
{
    const QString &name = raw.name;
    const size_t before = out.size();
    if (name == labels::kCpu) {
        extractCpu(raw, out);
    } else if (name == labels::kNetwork) {
        extractNetwork(raw, out);
    } else if (name == labels::kDisks) {
        extractDisks(raw, out);
    } else if (name == labels::kZfsPools) {
        extractZfsPools(raw, out);
    }
    if (out.size() != before) {
        return;
    }

    ParsedSection section = makeSection(name);
    for (const QString &line : raw.lines) {
        section.lines.push_back(line.toStdString());
    }

    if (name == labels::kStatusInformation) {
        extractStatus(raw, section);
    } else if (name == labels::kMemory) {
        extractMemory(raw, section);
    } else if (name == labels::kExternalIp) {
        if (!raw.lines.isEmpty() && !isMarker(raw.lines.first())) {
            section.fields["ip"] = raw.lines.first().trimmed().toStdString();
        }
    } else if (name == labels::kMount) {
        extractMount(raw, section);
    } else if (name == labels::kRcStatus) {
        extractRcStatus(raw, section);
    } else if (name == labels::kUpgradablePackages) {
        extractUpgradable(raw, section);
    } else if (name == labels::kUsers || name == labels::kGroups) {
        extractIndexed(raw, section);
    }
    out.push_back(std::move(section));
}

std::chrono::system_clock::time_point timestampFromPath(const QString &path)
{
    const QString fileName = QFileInfo(path).fileName();
    const QString prefix = QStringLiteral("system_status.");
    if (!fileName.startsWith(prefix)) {
        return {};
    }
    return fromReportStamp(fileName.mid(prefix.size(), 15).toStdString());
}

} // namespace

ParsedReport parseReportText(const QString &text, const QString &path)
{
    std::vector<RawSection> raw;
    bool expectUnderline = false;
    for (const QString &line : text.split(QLatin1Char('\n'))) {
        if (const auto header = detectHeader(line)) {
            raw.push_back(RawSection{*header, {}});
            expectUnderline = labels::isBanner(*header);
            continue;
        }
        if (expectUnderline) {
            expectUnderline = false;
            if (isUnderline(line)) {
                continue;
            }
        }
        if (raw.empty() || line.trimmed().isEmpty()) {
            continue;
        }
        raw.back().lines.push_back(line);
    }

    ParsedReport report;
    report.path = path.toStdString();
    for (const RawSection &section : raw) {
        appendParsed(section, report.sections);
    }

    for (const ParsedSection &section : report.sections) {
        if (section.name != labels::kStatusInformation.toStdString()) {
            continue;
        }
        const std::string date = section.fields.value("date", "");
        const std::string time = section.fields.value("time", "");
        if (!date.empty() && !time.empty()) {
            report.timestamp = fromLocalTime(date + " " + time, "%Y-%m-%d %H:%M:%S");
        }
        report.hostname = section.fields.value("hostname", "");
        break;
    }
    if (report.timestamp == std::chrono::system_clock::time_point{}) {
        report.timestamp = timestampFromPath(path);
    }
    return report;
}

std::optional<ParsedReport> parseReportFile(const QString &path, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (error) {
            *error = QStringLiteral("cannot read %1: %2").arg(path, file.errorString());
        }
        return std::nullopt;
    }
    return parseReportText(QString::fromUtf8(file.readAll()), path);
}

std::vector<ParsedReport> loadReports(const QString &dir)
{
    std::vector<ParsedReport> reports;
    QDirIterator it(dir, {QStringLiteral("system_status.*")}, QDir::Files,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        QString error;
        auto parsed = parseReportFile(path, &error);
        if (!parsed.has_value()) {
            SYSREPORT_LOG_WARN(QStringLiteral("ReportParser"),
                               QStringLiteral("loadReports"),
                               QStringLiteral("report_unreadable"),
                               (nlohmann::json{{"path", path.toStdString()},
                                               {"error", error.toStdString()}}));
            continue;
        }
        reports.push_back(std::move(*parsed));
    }

    std::sort(reports.begin(), reports.end(),
              [](const ParsedReport &a, const ParsedReport &b) {
                  if (a.timestamp != b.timestamp) {
                      return a.timestamp > b.timestamp;
                  }
                  return a.path > b.path;
              });
    return reports;
}

std::string sectionDisplayName(const ParsedSection &section)
{
    return section.instance.empty() ? section.name : section.instance;
}

} // namespace sysreport
