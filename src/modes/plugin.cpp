#include "plugin.hpp"

#include "../common/Config.hpp"
#include "../common/Constants.hpp"
#include "../common/Logging.hpp"
#include "../common/SignalWatcher.hpp"
#include "../core/emitter/ResponseEmitter.hpp"
#include "../core/router/CommandRouter.hpp"
#include "../core/session/GrpcSession.hpp"
#include "../core/supervisor/ReconnectSupervisor.hpp"
#include "../radio/HttpFetcher.hpp"
#include "../radio/RadioClient.hpp"
#include "../radio/commands/RadioCommands.hpp"

#include <QDateTime>
#include <QProcessEnvironment>
#include <QTimer>

#include <print>

namespace modes {

    using namespace sbr;

    namespace {

        qint64 wallClockMs() {
            return QDateTime::currentMSecsSinceEpoch();
        }

        radio::RadioClient::Options radioOptions(const Config& config) {
            radio::RadioClient::Options options;
            options.bucketCapacity  = config.upstreamBurst;
            options.refillPerSecond = config.upstreamRatePerSec;
            options.maxWaitMs       = config.upstreamMaxWaitMs;
            options.ttlByKey        = {{SOLAR_KEY, SOLAR_CACHE_TTL_MS}, {POTA_SPOTS_KEY, POTA_CACHE_TTL_MS}};
            return options;
        }

    } // namespace

    int runPlugin(QCoreApplication& app, const QCommandLineParser& parser) {
        QString    configError;
        const auto config = Config::fromSources(QProcessEnvironment::systemEnvironment(), parser, &configError);
        if (!config) {
            std::print(stderr, "seabird-radio: {}\n", configError.toStdString());
            return EXIT_CONFIG_ERROR;
        }

        setupLogging(config->logLevel);

        const auto endpoint = core::GrpcSession::endpointFromUrl(QUrl(config->coreUrl));
        if (!endpoint) {
            std::print(stderr, "seabird-radio: unsupported core URL \"{}\"\n", config->coreUrl.toStdString());
            return EXIT_CONFIG_ERROR;
        }

        std::print("Starting {} {}\n", PLUGIN_NAME, SBR_VERSION);
        std::print("Core: {} ({})\n", endpoint->target.toStdString(), endpoint->tls ? "tls" : "plaintext");
        std::print("Log level: {}\n", logLevelName(config->logLevel).toStdString());

        radio::HttpFetcher fetcher(UPSTREAM_TRANSFER_TIMEOUT);
        fetcher.setEndpoint(SOLAR_KEY, config->solarUrl);
        fetcher.setEndpoint(POTA_SPOTS_KEY, config->potaUrl);

        radio::RadioClient             radioClient(fetcher, radioOptions(*config));

        core::CommandRegistry::Builder builder;
        if (!radio::registerRadioCommands(builder, radioClient, wallClockMs)) {
            for (const QString& problem : builder.problems()) {
                qCCritical(lcPlugin) << "command registration:" << problem;
            }
            return EXIT_CONFIG_ERROR;
        }
        auto registry = builder.build();
        if (!registry) {
            return EXIT_CONFIG_ERROR;
        }

        core::GrpcSession::Options sessionOptions;
        sessionOptions.endpoint      = *endpoint;
        sessionOptions.pluginName    = PLUGIN_NAME;
        sessionOptions.pluginVersion = SBR_VERSION;
        sessionOptions.commands      = registry->commands();
        sessionOptions.keepaliveMs   = KEEPALIVE_TIME_MS;

        core::CommandRouter router(std::move(*registry), core::CommandRouter::Options{config->maxInFlight, config->commandTimeoutMs});

        core::ReconnectSupervisor::Options supervisorOptions;
        supervisorOptions.token              = config->token;
        supervisorOptions.handshakeTimeoutMs = config->handshakeTimeoutMs;
        supervisorOptions.livenessTimeoutMs  = config->livenessTimeoutMs;

        core::ReconnectSupervisor supervisor([sessionOptions]() -> std::unique_ptr<core::CoreSession> { return std::make_unique<core::GrpcSession>(sessionOptions); },
                                             core::BackoffPolicy(config->backoffBaseMs, config->backoffCapMs), supervisorOptions);

        core::ResponseEmitter emitter([&supervisor]() { return supervisor.liveSession(); });

        QObject::connect(&supervisor, &core::ReconnectSupervisor::envelopeReceived, &router, &core::CommandRouter::dispatch);
        QObject::connect(&router, &core::CommandRouter::responseReady, &emitter, &core::ResponseEmitter::emitResponse);

        QObject::connect(&supervisor, &core::ReconnectSupervisor::sessionLive, &app,
                         [](const QString& sessionId) { qCInfo(lcPlugin) << "serving commands on session" << sessionId; });
        QObject::connect(&supervisor, &core::ReconnectSupervisor::fatalError, &app, [&app](const QString& message) {
            std::print(stderr, "seabird-radio: {}\n", message.toStdString());
            app.exit(EXIT_AUTH_REJECTED);
        });

        QTimer purgeTimer;
        purgeTimer.setInterval(DEFAULT_CACHE_TTL_MS);
        QObject::connect(&purgeTimer, &QTimer::timeout, &app, [&radioClient]() {
            const int removed = radioClient.cache().purgeExpired();
            if (removed > 0) {
                qCDebug(lcRadio) << "purged" << removed << "expired cache entries";
            }
        });
        purgeTimer.start();

        SignalWatcher watcher;
        QObject::connect(&watcher, &SignalWatcher::terminationRequested, &app, [&app, &supervisor](int signalNumber) {
            qCInfo(lcPlugin) << "received signal" << signalNumber << "- shutting down";
            supervisor.stop();
            app.exit(EXIT_OK);
        });
        if (!watcher.install()) {
            std::print(stderr, "seabird-radio: could not install SIGINT/SIGTERM handlers\n");
            return EXIT_FAILURE_OTHER;
        }

        supervisor.start();
        const int code = app.exec();

        supervisor.stop();
        const auto& sent = emitter.stats();
        qCInfo(lcPlugin) << "stopped:" << sent.delivered << "responses delivered," << sent.dropped << "dropped";
        return code;
    }

} // namespace modes
