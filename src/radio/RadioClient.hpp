#pragma once

#include "../common/Constants.hpp"
#include "../common/Errors.hpp"
#include "RadioCache.hpp"
#include "TokenBucket.hpp"
#include "UpstreamFetcher.hpp"

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QString>

#include <functional>
#include <memory>

namespace sbr::radio {

    struct RadioReply {
        std::optional<ErrorKind> error; // RateLimited or UpstreamUnavailable
        QByteArray               payload;
        bool                     fromCache = false;

        [[nodiscard]] bool       ok() const {
            return !error.has_value();
        }
    };

    // Cached, rate-limited access to upstream radio data.
    //
    // A live cache entry answers immediately. Otherwise the query needs a token
    // from the bucket, waiting for one up to maxWaitMs before giving up with
    // RateLimited. Failed fetches are retried fetchAttempts times in total with a
    // fixed delay, then reported as UpstreamUnavailable.
    class RadioClient : public QObject {
        Q_OBJECT

      public:
        using Callback = std::function<void(RadioReply)>;
        using NowFn    = std::function<qint64()>;

        struct Options {
            int                 bucketCapacity  = UPSTREAM_BUCKET_CAPACITY;
            double              refillPerSecond = UPSTREAM_REFILL_PER_SEC;
            int                 maxWaitMs       = UPSTREAM_MAX_WAIT_MS;
            int                 fetchAttempts   = UPSTREAM_FETCH_ATTEMPTS;
            int                 retryDelayMs    = UPSTREAM_RETRY_DELAY_MS;
            int                 defaultTtlMs    = DEFAULT_CACHE_TTL_MS;
            QHash<QString, int> ttlByKey;
        };

        struct Stats {
            quint64 cacheHits        = 0;
            quint64 upstreamRequests = 0;
            quint64 rateLimited      = 0;
            quint64 unavailable      = 0;
        };

        RadioClient(UpstreamFetcher& fetcher, Options options, QObject* parent = nullptr);
        RadioClient(UpstreamFetcher& fetcher, Options options, NowFn nowFn, QObject* parent = nullptr);

        void                       query(const QString& key, Callback callback);

        [[nodiscard]] const Stats& stats() const {
            return m_stats;
        }
        [[nodiscard]] RadioCache& cache() {
            return m_cache;
        }

      private:
        struct Pending {
            QString  key;
            Callback callback;
            qint64   deadlineMs = 0;
            int      attempt    = 0;
        };

        bool             answerFromCache(const std::shared_ptr<Pending>& pending);
        void             acquire(const std::shared_ptr<Pending>& pending);
        void             fetch(const std::shared_ptr<Pending>& pending);
        void             fail(const std::shared_ptr<Pending>& pending, ErrorKind kind);
        int              ttlFor(const QString& key) const;

        UpstreamFetcher& m_fetcher;
        Options          m_options;
        NowFn            m_nowFn;
        RadioCache       m_cache;
        TokenBucket      m_bucket;
        Stats            m_stats;
    };

} // namespace sbr::radio
