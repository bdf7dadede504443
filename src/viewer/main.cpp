#include <QCoreApplication>

#include "viewer/ViewCli.hpp"
#include "common/logging.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sysreport-view"));

    sysreport::logging::initLogging(QStringLiteral("sysreport-view"),
                                    qEnvironmentVariableIntValue("SYSREPORT_VERBOSE") == 1);

    sysreport::ViewCli cli;
    return cli.run(argc, argv);
}
