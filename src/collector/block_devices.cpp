#include "collector/block_devices.hpp"

#include <algorithm>

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

#include "common/logging.hpp"

namespace sysreport {

namespace {

// Splits "nvme10n1" into {"nvme", "10", "n", "1"}.
QStringList splitRuns(const QString &name)
{
    QStringList runs;
    QString current;
    bool currentIsDigit = false;
    for (const QChar ch : name) {
        const bool isDigit = ch.isDigit();
        if (!current.isEmpty() && isDigit != currentIsDigit) {
            runs.push_back(current);
            current.clear();
        }
        currentIsDigit = isDigit;
        current.append(ch);
    }
    if (!current.isEmpty()) {
        runs.push_back(current);
    }
    return runs;
}

qsizetype commonPrefixLength(const QString &a, const QString &b)
{
    qsizetype length = 0;
    while (length < a.size() && length < b.size() && a.at(length) == b.at(length)) {
        ++length;
    }
    return length;
}

} // namespace

bool matchesDevicePattern(const QString &name, const QStringList &patterns)
{
    for (const QString &pattern : patterns) {
        const QRegularExpression regex(
            QRegularExpression::wildcardToRegularExpression(pattern));
        if (regex.match(name).hasMatch()) {
            return true;
        }
    }
    return false;
}

bool naturalDeviceLess(const QString &a, const QString &b)
{
    const QStringList runsA = splitRuns(a);
    const QStringList runsB = splitRuns(b);
    const qsizetype count = std::min(runsA.size(), runsB.size());
    for (qsizetype i = 0; i < count; ++i) {
        const QString &left = runsA.at(i);
        const QString &right = runsB.at(i);
        if (left == right) {
            continue;
        }
        const bool leftDigit = left.at(0).isDigit();
        const bool rightDigit = right.at(0).isDigit();
        if (leftDigit && rightDigit) {
            const qulonglong leftValue = left.toULongLong();
            const qulonglong rightValue = right.toULongLong();
            if (leftValue != rightValue) {
                return leftValue < rightValue;
            }
            return left.size() < right.size();
        }
        // Within one naming family the letter suffix grows after "z":
        // sdz < sdaa.
        if (left.size() != right.size() && commonPrefixLength(left, right) >= 2) {
            return left.size() < right.size();
        }
        return left < right;
    }
    return runsA.size() < runsB.size();
}

std::vector<BlockDevice> discoverBlockDevices(const QString &sysBlockDir,
                                              const QString &deviceNodeDir,
                                              const QStringList &patterns)
{
    std::vector<BlockDevice> devices;

    QDir dir(sysBlockDir);
    if (!dir.exists()) {
        SYSREPORT_LOG_WARN(QStringLiteral("BlockDevices"),
                           QStringLiteral("discoverBlockDevices"),
                           QStringLiteral("sysfs_missing"),
                           (nlohmann::json{{"dir", sysBlockDir.toStdString()}}));
        return devices;
    }

    QStringList names = dir.entryList(QDir::AllEntries | QDir::System | QDir::NoDotAndDotDot);
    std::sort(names.begin(), names.end(), naturalDeviceLess);

    for (const QString &name : names) {
        if (!matchesDevicePattern(name, patterns)) {
            continue;
        }
        const QString nodePath = QDir(deviceNodeDir).filePath(name);
        if (!QFileInfo::exists(nodePath)) {
            continue;
        }
        devices.push_back(BlockDevice{name, nodePath});
    }

    SYSREPORT_LOG_DEBUG(QStringLiteral("BlockDevices"),
                        QStringLiteral("discoverBlockDevices"),
                        QStringLiteral("devices_discovered"),
                        (nlohmann::json{{"candidates", names.size()},
                                        {"matched", devices.size()}}));
    return devices;
}

} // namespace sysreport
