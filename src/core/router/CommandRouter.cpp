#include "CommandRouter.hpp"

#include "../../common/Logging.hpp"

#include <QDateTime>
#include <QMetaObject>
#include <QPointer>

#include <exception>
#include <utility>

namespace sbr::core {

    CommandRouter::CommandRouter(CommandRegistry registry, Options options, QObject* parent)
        : CommandRouter(std::move(registry), options, [] { return QDateTime::currentMSecsSinceEpoch(); }, parent) {}

    CommandRouter::CommandRouter(CommandRegistry registry, Options options, NowFn nowFn, QObject* parent)
        : QObject(parent), m_registry(std::move(registry)), m_options(options), m_nowFn(std::move(nowFn)) {
        if (m_options.maxInFlight < 1) {
            m_options.maxInFlight = 1;
        }
    }

    void CommandRouter::dispatch(const CommandEnvelope& envelope) {
        if (m_activeIds.contains(activeKey(envelope))) {
            qCWarning(lcRouter) << "correlation id" << envelope.correlationId << "is already being handled on session" << envelope.sessionId
                                << "; ignoring the repeat";
            return;
        }

        const CommandSpec* spec = m_registry.find(envelope.command);
        if (!spec) {
            qCDebug(lcRouter) << "unknown command" << envelope.command << "for" << envelope.correlationId;
            answer(envelope, CommandResult::failure(ErrorKind::UnknownCommand, QString("unknown command \"%1\"").arg(envelope.command)));
            return;
        }

        if (!spec->acceptsArgCount(static_cast<int>(envelope.args.size()))) {
            qCDebug(lcRouter) << envelope.command << "called with" << envelope.args.size() << "arguments";
            answer(envelope, CommandResult::failure(ErrorKind::BadArguments, usageFor(spec->info)));
            return;
        }

        m_activeIds.insert(activeKey(envelope));

        if (m_inFlight.size() >= m_options.maxInFlight) {
            qCDebug(lcRouter) << "queueing" << envelope.correlationId << "-" << m_inFlight.size() << "commands running";
            m_pending.enqueue(envelope);
            return;
        }

        start(envelope, *spec);
    }

    void CommandRouter::start(const CommandEnvelope& envelope, const CommandSpec& spec) {
        const quint64 ticket = m_nextTicket++;

        auto*         timer = new QTimer(this);
        timer->setSingleShot(true);
        connect(timer, &QTimer::timeout, this, [this, ticket]() { complete(ticket, CommandResult::failure(ErrorKind::Timeout)); });

        m_inFlight.insert(ticket, Running{envelope, timer});
        timer->start(m_options.commandTimeoutMs);

        QPointer<CommandRouter> guard(this);
        ReplyFn                 reply = [guard, ticket](CommandResult result) {
            if (!guard) {
                return;
            }
            QMetaObject::invokeMethod(
                guard.data(),
                [guard, ticket, result = std::move(result)]() mutable {
                    if (guard) {
                        guard->complete(ticket, std::move(result));
                    }
                },
                Qt::AutoConnection);
        };

        qCDebug(lcRouter) << "running" << envelope.command << envelope.args << "for" << envelope.correlationId;

        try {
            spec.handler(envelope, std::move(reply));
        } catch (const std::exception& e) {
            qCWarning(lcRouter) << "handler for" << envelope.command << "threw:" << e.what();
            complete(ticket, CommandResult::failure(ErrorKind::Internal, e.what()));
        } catch (...) {
            qCWarning(lcRouter) << "handler for" << envelope.command << "threw a non-standard exception";
            complete(ticket, CommandResult::failure(ErrorKind::Internal));
        }
    }

    void CommandRouter::complete(quint64 ticket, CommandResult result) {
        auto it = m_inFlight.find(ticket);
        if (it == m_inFlight.end()) {
            qCDebug(lcRouter) << "dropping late completion for ticket" << ticket;
            return;
        }

        Running running = std::move(it.value());
        m_inFlight.erase(it);

        running.timer->stop();
        running.timer->deleteLater();

        if (!result.ok()) {
            const Error& error = *result.error;
            if (!isUserFacing(error.kind)) {
                // Operators get the detail, users only see "internal error"
                qCWarning(lcRouter) << running.envelope.command << "failed for" << running.envelope.correlationId << "with"
                                    << errorKindName(error.kind) << ":" << error.message;
                result = CommandResult::failure(ErrorKind::Internal);
            } else if (error.kind == ErrorKind::Timeout) {
                qCWarning(lcRouter) << running.envelope.command << "timed out for" << running.envelope.correlationId;
            } else {
                qCDebug(lcRouter) << running.envelope.command << "answered with" << errorKindName(error.kind);
            }
        }

        m_activeIds.remove(activeKey(running.envelope));
        answer(running.envelope, std::move(result));
        startQueued();
    }

    CommandRouter::ActiveKey CommandRouter::activeKey(const CommandEnvelope& envelope) {
        return {envelope.sessionId, envelope.correlationId};
    }

    void CommandRouter::answer(const CommandEnvelope& envelope, CommandResult result) {
        emit responseReady(ResponseEnvelope::answer(envelope, std::move(result), m_nowFn()));
    }

    void CommandRouter::startQueued() {
        while (!m_pending.isEmpty() && m_inFlight.size() < m_options.maxInFlight) {
            const CommandEnvelope envelope = m_pending.dequeue();
            const CommandSpec*    spec     = m_registry.find(envelope.command);
            if (!spec) {
                m_activeIds.remove(activeKey(envelope));
                answer(envelope, CommandResult::failure(ErrorKind::UnknownCommand));
                continue;
            }
            start(envelope, *spec);
        }
    }

} // namespace sbr::core
