#include <QCoreApplication>

#include "collector/CollectorCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sysreport"));

    sysreport::CollectorCli cli;
    return cli.run(argc, argv);
}
