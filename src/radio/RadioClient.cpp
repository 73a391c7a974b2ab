#include "RadioClient.hpp"

#include "../common/Logging.hpp"

#include <QDateTime>
#include <QPointer>
#include <QTimer>

#include <algorithm>
#include <utility>

namespace sbr::radio {

    RadioClient::RadioClient(UpstreamFetcher& fetcher, Options options, QObject* parent)
        : RadioClient(fetcher, std::move(options), [] { return QDateTime::currentMSecsSinceEpoch(); }, parent) {}

    RadioClient::RadioClient(UpstreamFetcher& fetcher, Options options, NowFn nowFn, QObject* parent)
        : QObject(parent), m_fetcher(fetcher), m_options(std::move(options)), m_nowFn(std::move(nowFn)), m_cache(m_nowFn),
          m_bucket(m_options.bucketCapacity, m_options.refillPerSecond, m_nowFn) {
        m_options.fetchAttempts = std::max(1, m_options.fetchAttempts);
    }

    void RadioClient::query(const QString& key, Callback callback) {
        auto pending        = std::make_shared<Pending>();
        pending->key        = key;
        pending->callback   = std::move(callback);
        pending->deadlineMs = m_nowFn() + m_options.maxWaitMs;

        if (answerFromCache(pending)) {
            return;
        }
        acquire(pending);
    }

    bool RadioClient::answerFromCache(const std::shared_ptr<Pending>& pending) {
        auto cached = m_cache.lookup(pending->key);
        if (!cached) {
            return false;
        }

        ++m_stats.cacheHits;
        pending->callback(RadioReply{std::nullopt, *cached, true});
        return true;
    }

    void RadioClient::acquire(const std::shared_ptr<Pending>& pending) {
        if (m_bucket.tryAcquire()) {
            fetch(pending);
            return;
        }

        const qint64 wait      = m_bucket.msUntilAvailable();
        const qint64 remaining = pending->deadlineMs - m_nowFn();
        if (wait > remaining) {
            qCInfo(lcRadio) << "rate limit reached for" << pending->key;
            ++m_stats.rateLimited;
            fail(pending, ErrorKind::RateLimited);
            return;
        }

        QTimer::singleShot(static_cast<int>(std::max<qint64>(wait, 1)), this, [this, pending]() {
            if (!answerFromCache(pending)) {
                acquire(pending);
            }
        });
    }

    void RadioClient::fetch(const std::shared_ptr<Pending>& pending) {
        ++pending->attempt;
        ++m_stats.upstreamRequests;

        QPointer<RadioClient> guard(this);
        m_fetcher.fetch(pending->key, [this, guard, pending](FetchResult result) {
            if (!guard) {
                return;
            }

            if (result.ok) {
                m_cache.store(pending->key, result.body, ttlFor(pending->key));
                pending->callback(RadioReply{std::nullopt, result.body, false});
                return;
            }

            if (pending->attempt < m_options.fetchAttempts) {
                qCDebug(lcRadio) << "retrying" << pending->key << "after:" << result.error;
                QTimer::singleShot(m_options.retryDelayMs, this, [this, pending]() { fetch(pending); });
                return;
            }

            qCWarning(lcRadio) << "giving up on" << pending->key << "after" << pending->attempt << "attempts:" << result.error;
            ++m_stats.unavailable;
            fail(pending, ErrorKind::UpstreamUnavailable);
        });
    }

    void RadioClient::fail(const std::shared_ptr<Pending>& pending, ErrorKind kind) {
        pending->callback(RadioReply{kind, {}, false});
    }

    int RadioClient::ttlFor(const QString& key) const {
        return m_options.ttlByKey.value(key, m_options.defaultTtlMs);
    }

} // namespace sbr::radio
