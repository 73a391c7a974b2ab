#pragma once

#include "../Envelope.hpp"
#include "../session/CoreSession.hpp"

#include <QObject>

#include <functional>

namespace sbr::core {

    // Single writer of responses onto whatever session is live right now.
    // Responses for a session that is gone are dropped, never re-sent on a new one.
    class ResponseEmitter : public QObject {
        Q_OBJECT

      public:
        // Returns the live session, or nullptr between sessions
        using SessionLookup = std::function<CoreSession*()>;

        struct Stats {
            quint64 delivered = 0;
            quint64 dropped   = 0;
        };

        explicit ResponseEmitter(SessionLookup lookup, QObject* parent = nullptr);

        // True when the response was written to the live session
        bool                       emitResponse(const ResponseEnvelope& response);

        [[nodiscard]] const Stats& stats() const {
            return m_stats;
        }

      signals:
        void responseDropped(const QString& correlationId, const QString& reason);

      private:
        void          drop(const ResponseEnvelope& response, const QString& reason);

        SessionLookup m_lookup;
        Stats         m_stats;
    };

} // namespace sbr::core
