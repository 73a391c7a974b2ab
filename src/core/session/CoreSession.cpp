#include "CoreSession.hpp"

#include "../../common/Logging.hpp"

#include <QDateTime>

#include <utility>

namespace sbr::core {

    CoreSession::CoreSession(QObject* parent) : CoreSession([] { return QDateTime::currentMSecsSinceEpoch(); }, parent) {}

    CoreSession::CoreSession(NowFn nowFn, QObject* parent) : QObject(parent), m_nowFn(std::move(nowFn)) {
        m_lastActivityMs.store(m_nowFn());
    }

    qint64 CoreSession::idleMs() const {
        return m_nowFn() - m_lastActivityMs.load();
    }

    void CoreSession::close() {
        if (m_state == State::Closed || m_state == State::Draining) {
            return;
        }

        advance(State::Draining);
        shutdownStream();
    }

    bool CoreSession::send(const ResponseEnvelope& response) {
        if (m_state != State::Authenticated) {
            qCDebug(lcSession) << "send on session" << m_id << "in state" << stateName(m_state);
            return false;
        }

        if (!writeResponse(response)) {
            qCWarning(lcSession) << "write failed on session" << m_id << "for" << response.correlationId;
            return false;
        }

        touch();
        return true;
    }

    QString CoreSession::stateName(State state) {
        switch (state) {
            case State::Connecting: return "connecting";
            case State::Authenticated: return "authenticated";
            case State::Draining: return "draining";
            case State::Closed: return "closed";
        }
        return "unknown";
    }

    void CoreSession::markAuthenticated(const QString& sessionId) {
        if (!advance(State::Authenticated)) {
            return;
        }

        m_id = sessionId;
        touch();
        emit authenticated(sessionId);
    }

    void CoreSession::failHandshake(ErrorKind kind, const QString& message) {
        if (m_state == State::Authenticated || m_state == State::Closed) {
            return;
        }

        emit handshakeFailed(kind, message);
        finish(message);
    }

    void CoreSession::deliver(CommandEnvelope envelope) {
        if (m_state != State::Authenticated && m_state != State::Draining) {
            qCWarning(lcSession) << "envelope" << envelope.correlationId << "arrived in state" << stateName(m_state) << "- not delivered";
            return;
        }

        envelope.sessionId = m_id;
        touch();
        emit envelopeReceived(envelope);
    }

    void CoreSession::finish(const QString& reason) {
        if (!advance(State::Closed)) {
            return;
        }

        emit closed(reason);
    }

    void CoreSession::touch() {
        m_lastActivityMs.store(m_nowFn());
    }

    bool CoreSession::advance(State next) {
        if (static_cast<int>(next) <= static_cast<int>(m_state)) {
            qCDebug(lcSession) << "ignoring transition" << stateName(m_state) << "->" << stateName(next);
            return false;
        }

        m_state = next;
        return true;
    }

} // namespace sbr::core
