#include "Logging.hpp"

#include <QStringList>

Q_LOGGING_CATEGORY(lcSession, "sbr.session", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSupervisor, "sbr.supervisor", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRouter, "sbr.router", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEmitter, "sbr.emitter", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRadio, "sbr.radio", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPlugin, "sbr.plugin", QtInfoMsg)

namespace sbr {

    std::optional<LogLevel> parseLogLevel(const QString& value) {
        const QString v = value.trimmed().toLower();
        if (v == "error")
            return LogLevel::Error;
        if (v == "warn" || v == "warning")
            return LogLevel::Warn;
        if (v == "info")
            return LogLevel::Info;
        if (v == "debug" || v == "trace")
            return LogLevel::Debug;
        return std::nullopt;
    }

    QString logLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::Error: return "error";
            case LogLevel::Warn: return "warn";
            case LogLevel::Info: return "info";
            case LogLevel::Debug: return "debug";
        }
        return "info";
    }

    void setupLogging(LogLevel level) {
        qSetMessagePattern("%{time yyyy-MM-ddThh:mm:ss.zzz} %{if-debug}DEBUG%{endif}%{if-info}INFO %{endif}%{if-warning}WARN %{endif}"
                           "%{if-critical}ERROR%{endif}%{if-fatal}FATAL%{endif} %{category}: %{message}");

        const bool  debug = level >= LogLevel::Debug;
        const bool  info  = level >= LogLevel::Info;
        const bool  warn  = level >= LogLevel::Warn;

        QStringList rules;
        rules << QString("sbr.*.debug=%1").arg(debug ? QStringLiteral("true") : QStringLiteral("false"));
        rules << QString("sbr.*.info=%1").arg(info ? QStringLiteral("true") : QStringLiteral("false"));
        rules << QString("sbr.*.warning=%1").arg(warn ? QStringLiteral("true") : QStringLiteral("false"));
        rules << "sbr.*.critical=true";
        QLoggingCategory::setFilterRules(rules.join('\n'));
    }

} // namespace sbr
