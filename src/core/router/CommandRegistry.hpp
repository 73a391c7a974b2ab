#pragma once

#include "../Envelope.hpp"

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

namespace sbr::core {

    // Completes a command. The router accepts the first call and ignores the rest.
    using ReplyFn = std::function<void(CommandResult)>;

    // Handlers may complete synchronously or later from the event loop.
    // Anything they throw is turned into an internal error response.
    using HandlerFn = std::function<void(const CommandEnvelope&, ReplyFn)>;

    struct CommandSpec {
        CommandInfo info;
        HandlerFn   handler;

        [[nodiscard]] bool acceptsArgCount(int count) const {
            return count >= info.minArgs && count <= info.maxArgs;
        }
    };

    // Read-only command table, built once before dispatching starts
    class CommandRegistry {
      public:
        class Builder {
          public:
            // False when the name is empty, already taken, or the arg range is inverted
            bool                                  add(CommandSpec spec);

            [[nodiscard]] const QStringList&      problems() const {
                return m_problems;
            }

            // std::nullopt if any add() was refused
            [[nodiscard]] std::optional<CommandRegistry> build() const;

          private:
            QHash<QString, CommandSpec> m_specs;
            QStringList                 m_order;
            QStringList                 m_problems;
        };

        [[nodiscard]] const CommandSpec* find(const QString& name) const;
        [[nodiscard]] QList<CommandInfo> commands() const;
        [[nodiscard]] qsizetype          size() const {
            return m_specs.size();
        }

      private:
        CommandRegistry() = default;

        QHash<QString, CommandSpec> m_specs;
        QStringList                 m_order;
    };

    // "pota <band> [mode]" style usage text derived from the arg range
    [[nodiscard]] QString usageFor(const CommandInfo& info);

} // namespace sbr::core
