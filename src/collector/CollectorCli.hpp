#pragma once

namespace sysreport {

class CollectorCli
{
public:
    // Parses the command line, loads configuration and runs one collection.
    // returns exit code: 0 written, 1 write failure, 2 usage or config error
    int run(int argc, char *argv[]);
};

} // namespace sysreport
