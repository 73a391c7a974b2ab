#pragma once

#include <QByteArray>
#include <QString>

#include <functional>

namespace sbr::radio {

    struct FetchResult {
        bool       ok = false;
        QByteArray body;
        QString    error;
    };

    // One raw request to an upstream radio data source. No caching, no retries.
    class UpstreamFetcher {
      public:
        using Callback = std::function<void(FetchResult)>;

        virtual ~UpstreamFetcher() = default;

        // The callback runs exactly once on the caller's thread
        virtual void fetch(const QString& key, Callback callback) = 0;
    };

} // namespace sbr::radio
