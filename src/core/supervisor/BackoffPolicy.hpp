#pragma once

#include <functional>

namespace sbr::core {

    // delay(attempt) = min(cap, base * 2^attempt) + jitter, jitter uniform in [0, that / 4]
    class BackoffPolicy {
      public:
        // Returns a value uniformly drawn from [0, bound]
        using JitterFn = std::function<int(int bound)>;

        BackoffPolicy(int baseMs, int capMs);
        BackoffPolicy(int baseMs, int capMs, JitterFn jitterFn);

        [[nodiscard]] int baseDelayMs(int attempt) const;
        [[nodiscard]] int delayMs(int attempt) const;

        // Upper bound of delayMs() for any attempt
        [[nodiscard]] int maxDelayMs() const;

        [[nodiscard]] int baseMs() const {
            return m_baseMs;
        }
        [[nodiscard]] int capMs() const {
            return m_capMs;
        }

      private:
        int      m_baseMs;
        int      m_capMs;
        JitterFn m_jitterFn;
    };

} // namespace sbr::core
