#include "HttpFetcher.hpp"

#include "../common/Constants.hpp"
#include "../common/Logging.hpp"

#include <QMetaObject>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <utility>

namespace sbr::radio {

    HttpFetcher::HttpFetcher(int transferTimeoutMs, QObject* parent) : QObject(parent), m_transferTimeoutMs(transferTimeoutMs) {}

    void HttpFetcher::setEndpoint(const QString& key, const QUrl& url) {
        m_endpoints.insert(key, url);
    }

    void HttpFetcher::fetch(const QString& key, Callback callback) {
        const auto it = m_endpoints.constFind(key);
        if (it == m_endpoints.constEnd()) {
            QMetaObject::invokeMethod(
                this, [callback = std::move(callback), key]() { callback(FetchResult{false, {}, QString("no endpoint for \"%1\"").arg(key)}); }, Qt::QueuedConnection);
            return;
        }

        QNetworkRequest request(it.value());
        request.setHeader(QNetworkRequest::UserAgentHeader, QString("%1/%2").arg(QString::fromLatin1(PLUGIN_NAME), QString::fromLatin1(SBR_VERSION)));
        request.setTransferTimeout(m_transferTimeoutMs);
        request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);

        qCDebug(lcRadio) << "GET" << request.url().toString();

        QNetworkReply* reply = m_network.get(request);
        connect(reply, &QNetworkReply::finished, this, [reply, key, callback = std::move(callback)]() {
            reply->deleteLater();

            FetchResult result;
            const int   status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

            if (reply->error() != QNetworkReply::NoError) {
                result.error = reply->errorString();
            } else if (status >= 400) {
                result.error = QString("HTTP %1").arg(status);
            } else {
                result.ok   = true;
                result.body = reply->readAll();
            }

            if (!result.ok) {
                qCDebug(lcRadio) << "fetch of" << key << "failed:" << result.error;
            }
            callback(std::move(result));
        });
    }

} // namespace sbr::radio
