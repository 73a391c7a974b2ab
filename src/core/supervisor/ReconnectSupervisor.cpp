#include "ReconnectSupervisor.hpp"

#include "../../common/Logging.hpp"

#include <utility>

namespace sbr::core {

    ReconnectSupervisor::ReconnectSupervisor(SessionFactory factory, BackoffPolicy backoff, Options options, QObject* parent)
        : QObject(parent), m_factory(std::move(factory)), m_backoff(std::move(backoff)), m_options(std::move(options)) {
        m_backoffTimer.setSingleShot(true);
        connect(&m_backoffTimer, &QTimer::timeout, this, [this]() { connectSession(); });

        m_handshakeTimer.setSingleShot(true);
        connect(&m_handshakeTimer, &QTimer::timeout, this, &ReconnectSupervisor::onHandshakeTimeout);

        m_livenessTimer.setInterval(m_options.livenessCheckMs);
        m_livenessTimer.setSingleShot(false);
        connect(&m_livenessTimer, &QTimer::timeout, this, &ReconnectSupervisor::checkLiveness);
    }

    ReconnectSupervisor::~ReconnectSupervisor() {
        // The session is our child; ~QObject reclaims it
        if (m_session) {
            m_session->disconnect(this);
            m_session->close();
        }
    }

    void ReconnectSupervisor::start() {
        if (m_state != State::Idle) {
            return;
        }

        m_attempt = 0;
        connectSession();
    }

    void ReconnectSupervisor::stop() {
        if (m_state == State::Idle || m_state == State::Fatal) {
            return;
        }

        qCInfo(lcSupervisor) << "stopping";
        m_backoffTimer.stop();
        retireSession();
        setState(State::Idle);
    }

    CoreSession* ReconnectSupervisor::liveSession() const {
        return m_state == State::Live ? m_session : nullptr;
    }

    QString ReconnectSupervisor::liveSessionId() const {
        const CoreSession* session = liveSession();
        return session ? session->id() : QString();
    }

    QString ReconnectSupervisor::stateName(State state) {
        switch (state) {
            case State::Idle: return "idle";
            case State::Connecting: return "connecting";
            case State::Live: return "live";
            case State::Backoff: return "backoff";
            case State::Fatal: return "fatal";
        }
        return "unknown";
    }

    void ReconnectSupervisor::connectSession() {
        setState(State::Connecting);

        std::unique_ptr<CoreSession> session = m_factory();
        if (!session) {
            failConnectAttempt("session factory produced no session");
            return;
        }

        m_session = session.release();
        m_session->setParent(this);

        connect(m_session, &CoreSession::authenticated, this, &ReconnectSupervisor::onAuthenticated);
        connect(m_session, &CoreSession::handshakeFailed, this, &ReconnectSupervisor::onHandshakeFailed);
        connect(m_session, &CoreSession::closed, this, &ReconnectSupervisor::onSessionClosed);
        connect(m_session, &CoreSession::envelopeReceived, this, &ReconnectSupervisor::envelopeReceived);

        m_handshakeTimer.start(m_options.handshakeTimeoutMs);
        qCDebug(lcSupervisor) << "connect attempt" << m_attempt;
        m_session->open(m_options.token);
    }

    void ReconnectSupervisor::onAuthenticated(const QString& sessionId) {
        if (m_state != State::Connecting) {
            return;
        }

        m_handshakeTimer.stop();
        m_attempt = 0;
        setState(State::Live);
        m_livenessTimer.start();

        qCInfo(lcSupervisor) << "session" << sessionId << "is live";
        emit sessionLive(sessionId);
    }

    void ReconnectSupervisor::onHandshakeFailed(ErrorKind kind, const QString& message) {
        if (m_state != State::Connecting) {
            return;
        }

        if (kind == ErrorKind::AuthInvalid) {
            qCCritical(lcSupervisor) << "core rejected the token:" << message;
            m_handshakeTimer.stop();
            retireSession();
            setState(State::Fatal);
            emit fatalError(message);
            return;
        }

        failConnectAttempt(QString("%1: %2").arg(errorKindName(kind), message));
    }

    void ReconnectSupervisor::onSessionClosed(const QString& reason) {
        if (m_state == State::Connecting) {
            failConnectAttempt(reason);
        } else if (m_state == State::Live) {
            loseLiveSession(reason);
        }
    }

    void ReconnectSupervisor::onHandshakeTimeout() {
        if (m_state == State::Connecting) {
            failConnectAttempt("handshake timed out");
        }
    }

    void ReconnectSupervisor::checkLiveness() {
        if (m_state != State::Live || !m_session) {
            return;
        }

        const qint64 idle = m_session->idleMs();
        if (idle > m_options.livenessTimeoutMs) {
            loseLiveSession(QString("no traffic for %1 ms").arg(idle));
        }
    }

    void ReconnectSupervisor::failConnectAttempt(const QString& reason) {
        ++m_attempt;
        qCWarning(lcSupervisor) << "connect attempt failed (" << m_attempt << "):" << reason;
        enterBackoff(reason);
    }

    void ReconnectSupervisor::loseLiveSession(const QString& reason) {
        const QString sessionId = m_session ? m_session->id() : QString();
        qCWarning(lcSupervisor) << "session" << sessionId << "lost:" << reason;
        emit sessionLost(sessionId, reason);
        enterBackoff(reason);
    }

    void ReconnectSupervisor::enterBackoff(const QString& reason) {
        retireSession();

        const int delay = m_backoff.delayMs(m_attempt);
        setState(State::Backoff);
        qCInfo(lcSupervisor) << "reconnecting in" << delay << "ms after:" << reason;
        emit backoffScheduled(m_attempt, delay);
        m_backoffTimer.start(delay);
    }

    void ReconnectSupervisor::retireSession() {
        m_handshakeTimer.stop();
        m_livenessTimer.stop();

        if (!m_session) {
            return;
        }

        CoreSession* session = m_session;
        m_session            = nullptr;
        session->disconnect(this);
        session->close();
        session->deleteLater();
    }

    void ReconnectSupervisor::setState(State state) {
        if (m_state == state) {
            return;
        }

        qCDebug(lcSupervisor) << stateName(m_state) << "->" << stateName(state);
        m_state = state;
        emit stateChanged(state);
    }

} // namespace sbr::core
