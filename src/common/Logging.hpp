#pragma once

#include <QLoggingCategory>
#include <QString>

#include <optional>

Q_DECLARE_LOGGING_CATEGORY(lcSession)
Q_DECLARE_LOGGING_CATEGORY(lcSupervisor)
Q_DECLARE_LOGGING_CATEGORY(lcRouter)
Q_DECLARE_LOGGING_CATEGORY(lcEmitter)
Q_DECLARE_LOGGING_CATEGORY(lcRadio)
Q_DECLARE_LOGGING_CATEGORY(lcPlugin)

namespace sbr {

    enum class LogLevel {
        Error,
        Warn,
        Info,
        Debug
    };

    // Accepts error|warn|warning|info|debug|trace, case-insensitive
    std::optional<LogLevel> parseLogLevel(const QString& value);
    QString                 logLevelName(LogLevel level);

    // Installs the message pattern and the category filter rules for sbr.*
    void setupLogging(LogLevel level);

} // namespace sbr
