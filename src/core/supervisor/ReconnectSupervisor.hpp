#pragma once

#include "../../common/Constants.hpp"
#include "../../common/Errors.hpp"
#include "../Envelope.hpp"
#include "../session/CoreSession.hpp"
#include "BackoffPolicy.hpp"

#include <QObject>
#include <QTimer>

#include <functional>
#include <memory>

namespace sbr::core {

    // Keeps one live, authenticated CoreSession around for as long as it runs.
    //
    // Idle -> Connecting on start(); Connecting -> Live on authentication;
    // Connecting -> Backoff on a recoverable failure; Backoff -> Connecting when
    // the delay elapses; Connecting -> Fatal on an invalid token;
    // Live -> Backoff on disconnection or liveness timeout. Fatal is terminal.
    class ReconnectSupervisor : public QObject {
        Q_OBJECT

      public:
        enum class State {
            Idle,
            Connecting,
            Live,
            Backoff,
            Fatal
        };
        Q_ENUM(State)

        using SessionFactory = std::function<std::unique_ptr<CoreSession>()>;

        struct Options {
            QString token;
            int     handshakeTimeoutMs = HANDSHAKE_TIMEOUT_MS;
            int     livenessTimeoutMs  = LIVENESS_TIMEOUT_MS;
            int     livenessCheckMs    = LIVENESS_CHECK_MS;
        };

        ReconnectSupervisor(SessionFactory factory, BackoffPolicy backoff, Options options, QObject* parent = nullptr);
        ~ReconnectSupervisor() override;

        void start();
        void stop();

        [[nodiscard]] State state() const {
            return m_state;
        }
        [[nodiscard]] int attempt() const {
            return m_attempt;
        }

        // The current session while Live, nullptr otherwise. Never keep it across event loop turns.
        [[nodiscard]] CoreSession* liveSession() const;
        [[nodiscard]] QString      liveSessionId() const;

        [[nodiscard]] static QString stateName(State state);

      signals:
        void stateChanged(sbr::core::ReconnectSupervisor::State state);
        void envelopeReceived(const sbr::core::CommandEnvelope& envelope);
        void sessionLive(const QString& sessionId);
        void sessionLost(const QString& sessionId, const QString& reason);
        void backoffScheduled(int attempt, int delayMs);
        void fatalError(const QString& message);

      private:
        void           connectSession();
        void           onAuthenticated(const QString& sessionId);
        void           onHandshakeFailed(ErrorKind kind, const QString& message);
        void           onSessionClosed(const QString& reason);
        void           onHandshakeTimeout();
        void           checkLiveness();
        void           failConnectAttempt(const QString& reason);
        void           loseLiveSession(const QString& reason);
        void           enterBackoff(const QString& reason);
        void           retireSession();
        void           setState(State state);

        SessionFactory m_factory;
        BackoffPolicy  m_backoff;
        Options        m_options;

        State          m_state   = State::Idle;
        int            m_attempt = 0;
        CoreSession*   m_session = nullptr;

        QTimer         m_backoffTimer;
        QTimer         m_handshakeTimer;
        QTimer         m_livenessTimer;
    };

} // namespace sbr::core
