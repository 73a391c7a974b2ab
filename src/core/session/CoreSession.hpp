#pragma once

#include "../../common/Errors.hpp"
#include "../Envelope.hpp"

#include <QObject>
#include <QString>

#include <atomic>
#include <functional>

namespace sbr::core {

    // One logical connection to the core. Subclasses own the actual stream;
    // this class owns the state machine and the activity clock.
    //
    // States only move forward: Connecting -> Authenticated -> Draining -> Closed,
    // with Connecting allowed to skip straight to Draining or Closed.
    class CoreSession : public QObject {
        Q_OBJECT

      public:
        enum class State {
            Connecting,
            Authenticated,
            Draining,
            Closed
        };

        using NowFn = std::function<qint64()>;

        explicit CoreSession(QObject* parent = nullptr);
        explicit CoreSession(NowFn nowFn, QObject* parent = nullptr);
        ~CoreSession() override = default;

        [[nodiscard]] QString id() const {
            return m_id;
        }
        [[nodiscard]] State state() const {
            return m_state;
        }
        [[nodiscard]] bool isAuthenticated() const {
            return m_state == State::Authenticated;
        }
        [[nodiscard]] qint64 lastActivityMs() const {
            return m_lastActivityMs.load();
        }
        [[nodiscard]] qint64 idleMs() const;

        // Starts the handshake; reports authenticated() or handshakeFailed()
        virtual void open(const QString& token) = 0;

        // Stops accepting work and tears the stream down; closed() follows
        void close();

        // False means a transport error: not Authenticated, or the frame was not accepted for writing
        bool send(const ResponseEnvelope& response);

        [[nodiscard]] static QString stateName(State state);

      signals:
        void authenticated(const QString& sessionId);
        void handshakeFailed(sbr::ErrorKind kind, const QString& message);
        void envelopeReceived(const sbr::core::CommandEnvelope& envelope);
        void closed(const QString& reason);

      protected:
        virtual bool writeResponse(const ResponseEnvelope& response) = 0;
        virtual void shutdownStream() = 0;

        void         markAuthenticated(const QString& sessionId);
        void         failHandshake(ErrorKind kind, const QString& message);
        void         deliver(CommandEnvelope envelope);
        void         finish(const QString& reason);
        void         touch();

      private:
        bool                advance(State next);

        NowFn               m_nowFn;
        QString             m_id;
        State               m_state{State::Connecting};
        std::atomic<qint64> m_lastActivityMs{0};
    };

} // namespace sbr::core
