#pragma once

#include <QMutex>

#include <functional>

namespace sbr::radio {

    class TokenBucket {
      public:
        using NowFn = std::function<qint64()>;

        TokenBucket(int capacity, double refillPerSecond);
        TokenBucket(int capacity, double refillPerSecond, NowFn nowFn);

        bool                 tryAcquire();

        // 0 when a token is available now
        [[nodiscard]] qint64 msUntilAvailable() const;
        [[nodiscard]] double available() const;
        [[nodiscard]] int    capacity() const {
            return m_capacity;
        }

      private:
        void          refillLocked() const;

        int           m_capacity;
        double        m_refillPerMs;
        NowFn         m_nowFn;

        mutable QMutex m_mutex;
        mutable double m_tokens;
        mutable qint64 m_lastRefillMs;
    };

} // namespace sbr::radio
