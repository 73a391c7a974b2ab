#include "BackoffPolicy.hpp"

#include <QRandomGenerator>

#include <algorithm>
#include <utility>

namespace sbr::core {

    BackoffPolicy::BackoffPolicy(int baseMs, int capMs)
        : BackoffPolicy(baseMs, capMs, [](int bound) { return bound > 0 ? static_cast<int>(QRandomGenerator::global()->bounded(bound + 1)) : 0; }) {}

    BackoffPolicy::BackoffPolicy(int baseMs, int capMs, JitterFn jitterFn) : m_baseMs(std::max(1, baseMs)), m_capMs(std::max(m_baseMs, capMs)), m_jitterFn(std::move(jitterFn)) {}

    int BackoffPolicy::baseDelayMs(int attempt) const {
        qint64 delay = m_baseMs;
        for (int i = 0; i < attempt && delay < m_capMs; ++i) {
            delay *= 2;
        }
        return static_cast<int>(std::min<qint64>(delay, m_capMs));
    }

    int BackoffPolicy::delayMs(int attempt) const {
        const int delay  = baseDelayMs(attempt);
        const int jitter = std::clamp(m_jitterFn(delay / 4), 0, delay / 4);
        return delay + jitter;
    }

    int BackoffPolicy::maxDelayMs() const {
        return m_capMs + m_capMs / 4;
    }

} // namespace sbr::core
