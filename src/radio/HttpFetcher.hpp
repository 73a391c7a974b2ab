#pragma once

#include "UpstreamFetcher.hpp"

#include <QHash>
#include <QNetworkAccessManager>
#include <QObject>
#include <QUrl>

namespace sbr::radio {

    // GETs the URL registered for a key
    class HttpFetcher : public QObject, public UpstreamFetcher {
        Q_OBJECT

      public:
        explicit HttpFetcher(int transferTimeoutMs, QObject* parent = nullptr);

        void setEndpoint(const QString& key, const QUrl& url);
        void fetch(const QString& key, Callback callback) override;

      private:
        QNetworkAccessManager m_network;
        QHash<QString, QUrl>  m_endpoints;
        int                   m_transferTimeoutMs;
    };

} // namespace sbr::radio
