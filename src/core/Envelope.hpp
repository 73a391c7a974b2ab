#pragma once

#include "../common/Errors.hpp"

#include <QHash>
#include <QMetaType>
#include <QString>
#include <QStringList>

#include <optional>

namespace sbr::core {

    // What the core is told about a command during the handshake
    struct CommandInfo {
        QString name;
        QString shortHelp;
        QString fullHelp;
        QString usage;
        int     minArgs = 0;
        int     maxArgs = 0;
    };

    struct ChannelSource {
        QString channelId;
        QString userId;
        QString displayName;
    };

    // One inbound command invocation, exactly as the core delivered it
    struct CommandEnvelope {
        QString                 correlationId;
        QString                 command;
        QStringList             args;
        ChannelSource           source;
        QHash<QString, QString> context;
        QString                 sessionId; // session that carried it
    };

    struct CommandResult {
        QStringList          lines;
        std::optional<Error> error;

        [[nodiscard]] bool   ok() const {
            return !error.has_value();
        }

        static CommandResult success(QStringList lines);
        // An empty message falls back to userMessage(kind)
        static CommandResult failure(ErrorKind kind, const QString& message = {});
    };

    struct ResponseEnvelope {
        QString                        correlationId;
        QString                        sessionId;
        CommandResult                  result;
        qint64                         emittedAtMs = 0;

        [[nodiscard]] static ResponseEnvelope answer(const CommandEnvelope& envelope, CommandResult result, qint64 nowMs);
    };

    // "<display name>: " when the invoking user is known, empty otherwise
    [[nodiscard]] QString replyPrefix(const ChannelSource& source);

} // namespace sbr::core

Q_DECLARE_METATYPE(sbr::core::CommandEnvelope)
Q_DECLARE_METATYPE(sbr::core::ResponseEnvelope)
