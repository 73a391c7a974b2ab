#include "Config.hpp"
#include "Constants.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace sbr {

    namespace {

        const QString OPT_URL               = "url";
        const QString OPT_LOG_LEVEL         = "log-level";
        const QString OPT_MAX_IN_FLIGHT     = "max-in-flight";
        const QString OPT_COMMAND_TIMEOUT   = "command-timeout";
        const QString OPT_HANDSHAKE_TIMEOUT = "handshake-timeout";
        const QString OPT_LIVENESS_TIMEOUT  = "liveness-timeout";
        const QString OPT_BACKOFF_BASE      = "backoff-base";
        const QString OPT_BACKOFF_CAP       = "backoff-cap";
        const QString OPT_UPSTREAM_BURST    = "upstream-burst";
        const QString OPT_UPSTREAM_RATE     = "upstream-rate";
        const QString OPT_UPSTREAM_WAIT     = "upstream-wait";
        const QString OPT_SOLAR_URL         = "solar-url";
        const QString OPT_POTA_URL          = "pota-url";

        bool readPositiveInt(const QCommandLineParser& parser, const QString& name, int fallback, int* out, QString* error) {
            if (!parser.isSet(name)) {
                *out = fallback;
                return true;
            }

            bool      ok    = false;
            const int value = parser.value(name).toInt(&ok);
            if (!ok || value <= 0) {
                *error = QString("--%1 expects a positive integer, got \"%2\"").arg(name, parser.value(name));
                return false;
            }
            *out = value;
            return true;
        }

        bool readUrl(const QCommandLineParser& parser, const QString& name, const char* fallback, QUrl* out, QString* error) {
            const QUrl url = QUrl::fromUserInput(parser.isSet(name) ? parser.value(name) : QString(fallback));
            if (!url.isValid() || (url.scheme() != "http" && url.scheme() != "https")) {
                *error = QString("--%1 expects an http(s) URL").arg(name);
                return false;
            }
            *out = url;
            return true;
        }

    } // namespace

    void Config::addOptions(QCommandLineParser& parser) {
        parser.addOption(QCommandLineOption(OPT_URL, "Seabird core URL (env SEABIRD_URL).", "url"));
        parser.addOption(QCommandLineOption(OPT_LOG_LEVEL, "Log level: error, warn, info, debug (env SEABIRD_LOG_LEVEL).", "level"));
        parser.addOption(QCommandLineOption(OPT_MAX_IN_FLIGHT, "Maximum concurrently running commands.", "count"));
        parser.addOption(QCommandLineOption(OPT_COMMAND_TIMEOUT, "Per-command timeout in milliseconds.", "ms"));
        parser.addOption(QCommandLineOption(OPT_HANDSHAKE_TIMEOUT, "Core handshake timeout in milliseconds.", "ms"));
        parser.addOption(QCommandLineOption(OPT_LIVENESS_TIMEOUT, "Idle time after which the core connection is considered dead.", "ms"));
        parser.addOption(QCommandLineOption(OPT_BACKOFF_BASE, "Initial reconnect delay in milliseconds.", "ms"));
        parser.addOption(QCommandLineOption(OPT_BACKOFF_CAP, "Maximum reconnect delay in milliseconds.", "ms"));
        parser.addOption(QCommandLineOption(OPT_UPSTREAM_BURST, "Upstream request burst size.", "count"));
        parser.addOption(QCommandLineOption(OPT_UPSTREAM_RATE, "Upstream requests per second after the burst.", "rate"));
        parser.addOption(QCommandLineOption(OPT_UPSTREAM_WAIT, "Longest wait for an upstream request slot in milliseconds.", "ms"));
        parser.addOption(QCommandLineOption(OPT_SOLAR_URL, "Solar conditions XML endpoint.", "url"));
        parser.addOption(QCommandLineOption(OPT_POTA_URL, "POTA spots JSON endpoint.", "url"));
    }

    std::optional<Config> Config::fromSources(const QProcessEnvironment& env, const QCommandLineParser& parser, QString* error) {
        QString scratch;
        if (!error)
            error = &scratch;

        Config config;

        config.coreUrl = parser.isSet(OPT_URL) ? parser.value(OPT_URL) : env.value("SEABIRD_URL", DEFAULT_CORE_URL);
        if (QUrl(config.coreUrl).host().isEmpty()) {
            *error = QString("invalid core URL \"%1\"").arg(config.coreUrl);
            return std::nullopt;
        }

        config.token = env.value("SEABIRD_TOKEN").trimmed();
        if (config.token.isEmpty()) {
            *error = "SEABIRD_TOKEN is not set";
            return std::nullopt;
        }

        const QString levelText = parser.isSet(OPT_LOG_LEVEL) ? parser.value(OPT_LOG_LEVEL) : env.value("SEABIRD_LOG_LEVEL", "info");
        const auto    level     = parseLogLevel(levelText);
        if (!level) {
            *error = QString("unknown log level \"%1\"").arg(levelText);
            return std::nullopt;
        }
        config.logLevel = *level;

        if (!readPositiveInt(parser, OPT_MAX_IN_FLIGHT, MAX_IN_FLIGHT_COMMANDS, &config.maxInFlight, error) ||
            !readPositiveInt(parser, OPT_COMMAND_TIMEOUT, COMMAND_TIMEOUT_MS, &config.commandTimeoutMs, error) ||
            !readPositiveInt(parser, OPT_HANDSHAKE_TIMEOUT, HANDSHAKE_TIMEOUT_MS, &config.handshakeTimeoutMs, error) ||
            !readPositiveInt(parser, OPT_LIVENESS_TIMEOUT, LIVENESS_TIMEOUT_MS, &config.livenessTimeoutMs, error) ||
            !readPositiveInt(parser, OPT_BACKOFF_BASE, BACKOFF_BASE_MS, &config.backoffBaseMs, error) ||
            !readPositiveInt(parser, OPT_BACKOFF_CAP, BACKOFF_CAP_MS, &config.backoffCapMs, error) ||
            !readPositiveInt(parser, OPT_UPSTREAM_BURST, UPSTREAM_BUCKET_CAPACITY, &config.upstreamBurst, error) ||
            !readPositiveInt(parser, OPT_UPSTREAM_WAIT, UPSTREAM_MAX_WAIT_MS, &config.upstreamMaxWaitMs, error)) {
            return std::nullopt;
        }

        if (config.backoffCapMs < config.backoffBaseMs) {
            *error = "--backoff-cap must not be smaller than --backoff-base";
            return std::nullopt;
        }

        config.upstreamRatePerSec = UPSTREAM_REFILL_PER_SEC;
        if (parser.isSet(OPT_UPSTREAM_RATE)) {
            bool ok                   = false;
            config.upstreamRatePerSec = parser.value(OPT_UPSTREAM_RATE).toDouble(&ok);
            if (!ok || config.upstreamRatePerSec <= 0.0) {
                *error = "--upstream-rate expects a positive number";
                return std::nullopt;
            }
        }

        if (!readUrl(parser, OPT_SOLAR_URL, DEFAULT_SOLAR_URL, &config.solarUrl, error) || !readUrl(parser, OPT_POTA_URL, DEFAULT_POTA_URL, &config.potaUrl, error)) {
            return std::nullopt;
        }

        return config;
    }

} // namespace sbr
