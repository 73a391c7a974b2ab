#include "CommandRegistry.hpp"

#include <utility>

namespace sbr::core {

    bool CommandRegistry::Builder::add(CommandSpec spec) {
        const QString name = spec.info.name.trimmed().toLower();

        if (name.isEmpty()) {
            m_problems << "command with an empty name";
            return false;
        }

        if (m_specs.contains(name)) {
            m_problems << QString("command \"%1\" registered twice").arg(name);
            return false;
        }

        if (spec.info.minArgs < 0 || spec.info.maxArgs < spec.info.minArgs) {
            m_problems << QString("command \"%1\" has an invalid argument range %2..%3").arg(name).arg(spec.info.minArgs).arg(spec.info.maxArgs);
            return false;
        }

        if (!spec.handler) {
            m_problems << QString("command \"%1\" has no handler").arg(name);
            return false;
        }

        spec.info.name = name;
        m_specs.insert(name, std::move(spec));
        m_order << name;
        return true;
    }

    std::optional<CommandRegistry> CommandRegistry::Builder::build() const {
        if (!m_problems.isEmpty()) {
            return std::nullopt;
        }

        CommandRegistry registry;
        registry.m_specs = m_specs;
        registry.m_order = m_order;
        return registry;
    }

    const CommandSpec* CommandRegistry::find(const QString& name) const {
        auto it = m_specs.constFind(name);
        return (it == m_specs.constEnd()) ? nullptr : &it.value();
    }

    QList<CommandInfo> CommandRegistry::commands() const {
        QList<CommandInfo> out;
        out.reserve(m_order.size());
        for (const QString& name : m_order) {
            out << m_specs.value(name).info;
        }
        return out;
    }

    QString usageFor(const CommandInfo& info) {
        if (!info.usage.isEmpty()) {
            return "usage: " + info.usage;
        }

        if (info.minArgs == info.maxArgs) {
            return QString("%1 takes %2 argument(s)").arg(info.name).arg(info.minArgs);
        }
        return QString("%1 takes %2 to %3 arguments").arg(info.name).arg(info.minArgs).arg(info.maxArgs);
    }

} // namespace sbr::core
