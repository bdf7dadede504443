#pragma once

#include <QString>
#include <QStringList>

// Section header text is read back by sysreport-view and by older external
// tooling; the spelling must not change between releases.
namespace sysreport::labels {

inline const QString kStatusInformation = QStringLiteral("STATUS INFORMATION");
inline const QString kAccessInformation = QStringLiteral("ACCESS INFORMATION");
inline const QString kCpu = QStringLiteral("CPU");
inline const QString kMemory = QStringLiteral("MEMORY");
inline const QString kNetwork = QStringLiteral("NETWORK");
inline const QString kExternalIp = QStringLiteral("EXTERNAL IP ADDRESS");
inline const QString kDisks = QStringLiteral("DISKS");
inline const QString kMount = QStringLiteral("MOUNT");
inline const QString kZfsPools = QStringLiteral("ZFS POOLS");
inline const QString kSmartStatus = QStringLiteral("SMART STATUS");
inline const QString kRcStatus = QStringLiteral("RC STATUS");
inline const QString kUsb = QStringLiteral("USB");
inline const QString kUpgradablePackages = QStringLiteral("UPGRADABLE PACKAGES");
inline const QString kProcesses = QStringLiteral("PROCESSES");
inline const QString kUsers = QStringLiteral("USERS");
inline const QString kGroups = QStringLiteral("GROUPS");

// Report order.
inline QStringList all()
{
    return {kStatusInformation, kAccessInformation, kCpu, kMemory, kNetwork,
            kExternalIp, kDisks, kMount, kZfsPools, kSmartStatus, kRcStatus,
            kUsb, kUpgradablePackages, kProcesses, kUsers, kGroups};
}

// Sections rendered as a title with an underline rather than "# LABEL:".
inline bool isBanner(const QString &label)
{
    return label == kStatusInformation || label == kAccessInformation
        || label == kUpgradablePackages;
}

// Sections whose text comes from configurable commands. The others are
// produced in-process (status block, public IP, per-device health).
inline bool acceptsCommandOverride(const QString &label)
{
    return all().contains(label) && label != kStatusInformation && label != kExternalIp
        && label != kSmartStatus;
}

} // namespace sysreport::labels
