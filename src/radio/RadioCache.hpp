#pragma once

#include <QByteArray>
#include <QHash>
#include <QReadWriteLock>
#include <QString>

#include <functional>
#include <optional>

namespace sbr::radio {

    // Key -> payload cache with per-entry expiry. Entries only leave through expiry.
    class RadioCache {
      public:
        using NowFn = std::function<qint64()>;

        RadioCache();
        explicit RadioCache(NowFn nowFn);

        // Live entry or std::nullopt when missing/expired
        std::optional<QByteArray> lookup(const QString& key) const;
        void                      store(const QString& key, const QByteArray& payload, qint64 ttlMs);

        // Removes expired entries, returns how many were removed
        int                       purgeExpired();
        qsizetype                 size() const;

      private:
        struct Entry {
            QByteArray payload;
            qint64     expiresAtMs = 0;
        };

        NowFn                  m_nowFn;
        mutable QReadWriteLock m_lock;
        QHash<QString, Entry>  m_entries;
    };

} // namespace sbr::radio
