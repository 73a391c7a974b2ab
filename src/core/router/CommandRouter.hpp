#pragma once

#include "../../common/Constants.hpp"
#include "../Envelope.hpp"
#include "CommandRegistry.hpp"

#include <QHash>
#include <QPair>
#include <QObject>
#include <QQueue>
#include <QSet>
#include <QTimer>

#include <functional>

namespace sbr::core {

    // Dispatches inbound commands to their handlers. Every envelope it accepts
    // produces exactly one responseReady(), in completion order.
    class CommandRouter : public QObject {
        Q_OBJECT

      public:
        using NowFn = std::function<qint64()>;

        struct Options {
            int maxInFlight      = MAX_IN_FLIGHT_COMMANDS;
            int commandTimeoutMs = COMMAND_TIMEOUT_MS;
        };

        CommandRouter(CommandRegistry registry, Options options, QObject* parent = nullptr);
        CommandRouter(CommandRegistry registry, Options options, NowFn nowFn, QObject* parent = nullptr);

        void                   dispatch(const CommandEnvelope& envelope);

        [[nodiscard]] int      inFlight() const {
            return static_cast<int>(m_inFlight.size());
        }
        [[nodiscard]] int queued() const {
            return static_cast<int>(m_pending.size());
        }
        [[nodiscard]] const CommandRegistry& registry() const {
            return m_registry;
        }

      signals:
        void responseReady(const sbr::core::ResponseEnvelope& response);

      private:
        using ActiveKey = QPair<QString, QString>; // session id, correlation id

        struct Running {
            CommandEnvelope envelope;
            QTimer*         timer = nullptr;
        };

        void                     start(const CommandEnvelope& envelope, const CommandSpec& spec);
        void                     complete(quint64 ticket, CommandResult result);
        void                     answer(const CommandEnvelope& envelope, CommandResult result);
        void                     startQueued();

        static ActiveKey         activeKey(const CommandEnvelope& envelope);

        CommandRegistry          m_registry;
        Options                  m_options;
        NowFn                    m_nowFn;

        QHash<quint64, Running>  m_inFlight;
        QQueue<CommandEnvelope>  m_pending;
        QSet<ActiveKey>          m_activeIds; // queued or running, per session
        quint64                  m_nextTicket = 1;
    };

} // namespace sbr::core
