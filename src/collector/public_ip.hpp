#pragma once

#include <QString>

namespace sysreport {

struct PublicIpResult {
    bool ok = false;
    QString address;
    QString error;
};

// Asks an external IP-echo service for the address this host is seen from.
class PublicIpLookup
{
public:
    virtual ~PublicIpLookup() = default;

    virtual PublicIpResult lookup(const QString &url, int timeoutMs) = 0;
};

// HTTP GET through QNetworkAccessManager, bounded by timeoutMs overall.
// Needs a QCoreApplication instance; runs a local event loop until done.
class NetworkPublicIpLookup : public PublicIpLookup
{
public:
    PublicIpResult lookup(const QString &url, int timeoutMs) override;
};

} // namespace sysreport
