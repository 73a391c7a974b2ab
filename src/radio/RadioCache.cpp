#include "RadioCache.hpp"

#include <QDateTime>

#include <utility>

namespace sbr::radio {

    RadioCache::RadioCache() : RadioCache([] { return QDateTime::currentMSecsSinceEpoch(); }) {}

    RadioCache::RadioCache(NowFn nowFn) : m_nowFn(std::move(nowFn)) {}

    std::optional<QByteArray> RadioCache::lookup(const QString& key) const {
        QReadLocker locker(&m_lock);

        auto        it = m_entries.constFind(key);
        if (it == m_entries.constEnd() || it->expiresAtMs <= m_nowFn()) {
            return std::nullopt;
        }
        return it->payload;
    }

    void RadioCache::store(const QString& key, const QByteArray& payload, qint64 ttlMs) {
        QWriteLocker locker(&m_lock);
        m_entries.insert(key, Entry{payload, m_nowFn() + ttlMs});
    }

    int RadioCache::purgeExpired() {
        QWriteLocker locker(&m_lock);

        const qint64 nowMs   = m_nowFn();
        int          removed = 0;
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (it->expiresAtMs <= nowMs) {
                it = m_entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    qsizetype RadioCache::size() const {
        QReadLocker locker(&m_lock);
        return m_entries.size();
    }

} // namespace sbr::radio
