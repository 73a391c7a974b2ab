#include "ResponseEmitter.hpp"

#include "../../common/Logging.hpp"

#include <utility>

namespace sbr::core {

    ResponseEmitter::ResponseEmitter(SessionLookup lookup, QObject* parent) : QObject(parent), m_lookup(std::move(lookup)) {}

    bool ResponseEmitter::emitResponse(const ResponseEnvelope& response) {
        CoreSession* session = m_lookup ? m_lookup() : nullptr;

        if (!session || !session->isAuthenticated()) {
            drop(response, "no live session");
            return false;
        }

        if (session->id() != response.sessionId) {
            drop(response, QString("session %1 is gone, live session is %2").arg(response.sessionId, session->id()));
            return false;
        }

        if (!session->send(response)) {
            drop(response, "write failed");
            return false;
        }

        ++m_stats.delivered;
        return true;
    }

    void ResponseEmitter::drop(const ResponseEnvelope& response, const QString& reason) {
        ++m_stats.dropped;
        qCInfo(lcEmitter) << "dropping response" << response.correlationId << "-" << reason << "(" << m_stats.dropped << "dropped so far)";
        emit responseDropped(response.correlationId, reason);
    }

} // namespace sbr::core
