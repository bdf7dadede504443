#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <memory>

#include "collector/block_devices.hpp"

class BlockDeviceTests : public QObject
{
    Q_OBJECT
private slots:
    void init();

    void testDefaultPatternSkipsNvme();
    void testNvmePatternIncludesNvme();
    void testMissingNodeIsSkipped();
    void testNaturalOrderBeyondSdz();
    void testMissingSysfsDirectory();

private:
    void addDevice(const QString &name, bool withNode);
    QStringList discoveredNames(const QStringList &patterns) const;

    std::unique_ptr<QTemporaryDir> m_tempDir;
};

void BlockDeviceTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    QVERIFY(QDir().mkpath(m_tempDir->path() + "/sys/block"));
    QVERIFY(QDir().mkpath(m_tempDir->path() + "/dev"));
}

void BlockDeviceTests::addDevice(const QString &name, bool withNode)
{
    QDir().mkpath(m_tempDir->path() + "/sys/block/" + name);
    if (withNode) {
        QFile node(m_tempDir->path() + "/dev/" + name);
        QVERIFY(node.open(QIODevice::WriteOnly));
    }
}

QStringList BlockDeviceTests::discoveredNames(const QStringList &patterns) const
{
    QStringList names;
    const auto devices = sysreport::discoverBlockDevices(m_tempDir->path() + "/sys/block",
                                                         m_tempDir->path() + "/dev",
                                                         patterns);
    for (const auto &device : devices) {
        names << device.name;
    }
    return names;
}

void BlockDeviceTests::testDefaultPatternSkipsNvme()
{
    addDevice(QStringLiteral("sda"), true);
    addDevice(QStringLiteral("nvme0n1"), true);
    addDevice(QStringLiteral("loop0"), true);

    const QStringList names = discoveredNames({QStringLiteral("sd*")});
    QCOMPARE(names, QStringList{QStringLiteral("sda")});
}

void BlockDeviceTests::testNvmePatternIncludesNvme()
{
    addDevice(QStringLiteral("sda"), true);
    addDevice(QStringLiteral("nvme10n1"), true);
    addDevice(QStringLiteral("nvme0n1"), true);

    const QStringList names = discoveredNames({QStringLiteral("sd*"), QStringLiteral("nvme*")});
    QCOMPARE(names, (QStringList{QStringLiteral("nvme0n1"), QStringLiteral("nvme10n1"),
                                 QStringLiteral("sda")}));

    const auto devices = sysreport::discoverBlockDevices(m_tempDir->path() + "/sys/block",
                                                         m_tempDir->path() + "/dev",
                                                         {QStringLiteral("nvme0n1")});
    QCOMPARE(devices.size(), static_cast<size_t>(1));
    QCOMPARE(devices.front().nodePath, m_tempDir->path() + "/dev/nvme0n1");
}

void BlockDeviceTests::testMissingNodeIsSkipped()
{
    addDevice(QStringLiteral("sda"), true);
    addDevice(QStringLiteral("sdb"), false);
    addDevice(QStringLiteral("sdc"), true);

    QCOMPARE(discoveredNames({QStringLiteral("sd*")}),
             (QStringList{QStringLiteral("sda"), QStringLiteral("sdc")}));
}

void BlockDeviceTests::testNaturalOrderBeyondSdz()
{
    addDevice(QStringLiteral("sdaa"), true);
    addDevice(QStringLiteral("sdz"), true);
    addDevice(QStringLiteral("sdb"), true);
    addDevice(QStringLiteral("sda"), true);

    QCOMPARE(discoveredNames({QStringLiteral("sd*")}),
             (QStringList{QStringLiteral("sda"), QStringLiteral("sdb"), QStringLiteral("sdz"),
                          QStringLiteral("sdaa")}));

    QVERIFY(sysreport::naturalDeviceLess(QStringLiteral("sdz"), QStringLiteral("sdaa")));
    QVERIFY(!sysreport::naturalDeviceLess(QStringLiteral("sdaa"), QStringLiteral("sdz")));
    QVERIFY(sysreport::naturalDeviceLess(QStringLiteral("nvme2n1"), QStringLiteral("nvme10n1")));
}

void BlockDeviceTests::testMissingSysfsDirectory()
{
    const auto devices = sysreport::discoverBlockDevices(m_tempDir->path() + "/nope",
                                                         m_tempDir->path() + "/dev",
                                                         {QStringLiteral("sd*")});
    QVERIFY(devices.empty());
}

QTEST_MAIN(BlockDeviceTests)
#include "test_block_devices.moc"
