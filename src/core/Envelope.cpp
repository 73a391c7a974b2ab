#include "Envelope.hpp"

#include <utility>

namespace sbr::core {

    CommandResult CommandResult::success(QStringList lines) {
        CommandResult result;
        result.lines = std::move(lines);
        return result;
    }

    CommandResult CommandResult::failure(ErrorKind kind, const QString& message) {
        CommandResult result;
        result.error = Error{kind, message.isEmpty() ? userMessage(kind) : message};
        return result;
    }

    ResponseEnvelope ResponseEnvelope::answer(const CommandEnvelope& envelope, CommandResult result, qint64 nowMs) {
        ResponseEnvelope response;
        response.correlationId = envelope.correlationId;
        response.sessionId     = envelope.sessionId;
        response.result        = std::move(result);
        response.emittedAtMs   = nowMs;
        return response;
    }

    QString replyPrefix(const ChannelSource& source) {
        return source.displayName.isEmpty() ? QString() : source.displayName + ": ";
    }

} // namespace sbr::core
