#include "TokenBucket.hpp"

#include <QDateTime>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace sbr::radio {

    TokenBucket::TokenBucket(int capacity, double refillPerSecond) : TokenBucket(capacity, refillPerSecond, [] { return QDateTime::currentMSecsSinceEpoch(); }) {}

    TokenBucket::TokenBucket(int capacity, double refillPerSecond, NowFn nowFn)
        : m_capacity(std::max(1, capacity)), m_refillPerMs(std::max(0.0, refillPerSecond) / 1000.0), m_nowFn(std::move(nowFn)), m_tokens(m_capacity),
          m_lastRefillMs(m_nowFn()) {}

    bool TokenBucket::tryAcquire() {
        QMutexLocker locker(&m_mutex);
        refillLocked();

        if (m_tokens < 1.0) {
            return false;
        }
        m_tokens -= 1.0;
        return true;
    }

    qint64 TokenBucket::msUntilAvailable() const {
        QMutexLocker locker(&m_mutex);
        refillLocked();

        if (m_tokens >= 1.0) {
            return 0;
        }
        if (m_refillPerMs <= 0.0) {
            return std::numeric_limits<qint64>::max();
        }
        return static_cast<qint64>(std::ceil((1.0 - m_tokens) / m_refillPerMs));
    }

    double TokenBucket::available() const {
        QMutexLocker locker(&m_mutex);
        refillLocked();
        return m_tokens;
    }

    void TokenBucket::refillLocked() const {
        const qint64 nowMs   = m_nowFn();
        const qint64 elapsed = nowMs - m_lastRefillMs;
        if (elapsed <= 0) {
            return;
        }

        m_tokens       = std::min<double>(m_capacity, m_tokens + static_cast<double>(elapsed) * m_refillPerMs);
        m_lastRefillMs = nowMs;
    }

} // namespace sbr::radio
