#pragma once

#include <vector>

#include <QString>
#include <QStringList>

namespace sysreport {

struct BlockDevice {
    QString name;
    QString nodePath;
};

/**
 * Enumerate block devices known to the kernel (entries of sysBlockDir,
 * normally /sys/block) whose names match one of the glob patterns and whose
 * device node exists under deviceNodeDir at the time of the call.
 *
 * The result is in natural order: sda, sdb, ..., sdz, sdaa; nvme0n1 before
 * nvme10n1.
 */
std::vector<BlockDevice> discoverBlockDevices(const QString &sysBlockDir,
                                              const QString &deviceNodeDir,
                                              const QStringList &patterns);

bool matchesDevicePattern(const QString &name, const QStringList &patterns);

bool naturalDeviceLess(const QString &a, const QString &b);

} // namespace sysreport
