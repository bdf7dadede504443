#include "collector/public_ip.hpp"

#include <memory>

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include "common/logging.hpp"

namespace sysreport {

PublicIpResult NetworkPublicIpLookup::lookup(const QString &url, int timeoutMs)
{
    PublicIpResult result;

    const QUrl target(url);
    if (!target.isValid() || target.scheme().isEmpty()) {
        result.error = QStringLiteral("invalid URL %1").arg(url);
        return result;
    }

    QNetworkAccessManager manager;
    QNetworkRequest request(target);
    request.setTransferTimeout(timeoutMs);
    request.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("curl/8"));

    std::unique_ptr<QNetworkReply> reply(manager.get(request));

    bool timedOut = false;
    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(&deadline, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    deadline.start(timeoutMs);
    if (!reply->isFinished()) {
        loop.exec();
    }
    deadline.stop();

    if (timedOut) {
        result.error = QStringLiteral("timed out after %1 ms").arg(timeoutMs);
    } else if (reply->error() != QNetworkReply::NoError) {
        result.error = reply->errorString();
    } else {
        result.address = QString::fromUtf8(reply->readAll()).trimmed();
        result.ok = true;
    }

    if (!result.ok) {
        SYSREPORT_LOG_WARN(QStringLiteral("PublicIpLookup"),
                           QStringLiteral("lookup"),
                           QStringLiteral("public_ip_failed"),
                           (nlohmann::json{{"url", url.toStdString()},
                                           {"error", result.error.toStdString()}}));
    }
    return result;
}

} // namespace sysreport
