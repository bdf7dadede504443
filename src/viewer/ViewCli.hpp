#pragma once

#include <QString>
#include <QStringList>

namespace sysreport {

class ViewCli
{
public:
    // CLI dispatcher for browsing and comparing stored reports.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runSections(const QStringList &args);
    int runTable(const QStringList &args);
    int runShow(const QStringList &args);
};

} // namespace sysreport
