#pragma once

#include "Logging.hpp"

#include <QProcessEnvironment>
#include <QString>
#include <QUrl>

#include <optional>

class QCommandLineParser;

namespace sbr {

    struct Config {
        QString  coreUrl;
        QString  token;
        LogLevel logLevel = LogLevel::Info;

        int      maxInFlight        = 0;
        int      commandTimeoutMs   = 0;
        int      handshakeTimeoutMs = 0;
        int      livenessTimeoutMs  = 0;
        int      backoffBaseMs      = 0;
        int      backoffCapMs       = 0;

        int      upstreamBurst     = 0;
        double   upstreamRatePerSec = 0.0;
        int      upstreamMaxWaitMs = 0;
        QUrl     solarUrl;
        QUrl     potaUrl;

        // Registers every option understood by fromSources()
        static void addOptions(QCommandLineParser& parser);

        // Command-line values win over environment values, which win over the defaults in Constants.hpp.
        // Returns std::nullopt and fills *error on any invalid or missing value.
        static std::optional<Config> fromSources(const QProcessEnvironment& env, const QCommandLineParser& parser, QString* error);
    };

} // namespace sbr
