module;
#include <QEventLoop>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QObject>
#include <QPointer>
#include <QSslError>
#include <QTimer>
#include <QUrl>
#include <QVariant>
#include <QtGlobal>

module devsrv.core.statusprober;

namespace {
constexpr int kMaxAdminTimeoutMs = 1000;
constexpr int kMaxSiteTimeoutMs = 2000;
// Extra time for the loop guard beyond the transfer timeout.
constexpr int kGuardSlackMs = 250;
}

bool StatusProber::adminAlive(quint16 adminPort, int timeoutMs)
{
    const QUrl url(QStringLiteral("http://127.0.0.1:%1/config/").arg(adminPort));
    const int boundedTimeout = qBound(1, timeoutMs, kMaxAdminTimeoutMs);
    return requestStatus(url, false, boundedTimeout) > 0;
}

SiteStatus StatusProber::probeSite(const QUrl& url, int timeoutMs)
{
    if (!url.isValid() || url.host().isEmpty()) {
        return SiteStatus::Error;
    }

    const int boundedTimeout = qBound(1, timeoutMs, kMaxSiteTimeoutMs);
    return classifyHttpStatus(requestStatus(url, true, boundedTimeout));
}

SiteStatus StatusProber::classifyHttpStatus(int statusCode)
{
    if (statusCode >= 200 && statusCode < 400) {
        return SiteStatus::On;
    }
    return SiteStatus::Error;
}

int StatusProber::requestStatus(const QUrl& url, bool head, int timeoutMs, QString *errorMessage)
{
    QNetworkAccessManager manager;
    manager.setProxy(QNetworkProxy::NoProxy);

    QNetworkRequest request(url);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    request.setTransferTimeout(timeoutMs);

    QPointer<QNetworkReply> reply = head ? manager.head(request) : manager.get(request);

    // Caddy serves `tls internal` certificates signed by its local CA.
    QObject::connect(reply, &QNetworkReply::sslErrors, reply, [reply](const QList<QSslError>&) {
        if (reply) {
            reply->ignoreSslErrors();
        }
    });

    QEventLoop loop;
    QTimer guard;
    guard.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&guard, &QTimer::timeout, &loop, [&loop, reply]() {
        if (reply) {
            reply->abort();
        }
        loop.quit();
    });

    guard.start(timeoutMs + kGuardSlackMs);
    if (!reply->isFinished()) {
        loop.exec(QEventLoop::ExcludeUserInputEvents);
    }
    guard.stop();

    if (!reply) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Request was destroyed before finishing.");
        }
        return -1;
    }

    const QVariant statusAttribute = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    const int status = statusAttribute.isValid() ? statusAttribute.toInt() : -1;
    if (status <= 0 && errorMessage) {
        *errorMessage = reply->errorString();
    }

    reply->deleteLater();
    return status > 0 ? status : -1;
}
