#include "common/Config.hpp"
#include "common/Constants.hpp"
#include "common/Errors.hpp"

#include <QtTest/QtTest>

#include <QCommandLineParser>

namespace sbr {

    namespace {

        std::optional<Config> load(const QStringList& args, const QHash<QString, QString>& vars, QString* error = nullptr) {
            QCommandLineParser parser;
            Config::addOptions(parser);
            if (!parser.parse(QStringList{"seabird-radio"} + args)) {
                if (error) {
                    *error = parser.errorText();
                }
                return std::nullopt;
            }

            QProcessEnvironment env;
            for (auto it = vars.cbegin(); it != vars.cend(); ++it) {
                env.insert(it.key(), it.value());
            }
            return Config::fromSources(env, parser, error);
        }

    } // namespace

    class ConfigTest : public QObject {
        Q_OBJECT

      private slots:
        void defaults_applyWithOnlyAToken();
        void missingToken_isAnError();
        void commandLine_overridesEnvironment();
        void invalidNumbers_areRejected();
        void backoffCap_belowBase_isRejected();
        void logLevels_parse();
        void errorKinds_haveStableNames();
    };

    void ConfigTest::defaults_applyWithOnlyAToken() {
        const auto config = load({}, {{"SEABIRD_TOKEN", "  abc123  "}});
        QVERIFY(config.has_value());
        QCOMPARE(config->token, QString("abc123"));
        QCOMPARE(config->coreUrl, QString(DEFAULT_CORE_URL));
        QCOMPARE(config->logLevel, LogLevel::Info);
        QCOMPARE(config->maxInFlight, MAX_IN_FLIGHT_COMMANDS);
        QCOMPARE(config->backoffBaseMs, BACKOFF_BASE_MS);
        QCOMPARE(config->backoffCapMs, BACKOFF_CAP_MS);
        QCOMPARE(config->upstreamBurst, UPSTREAM_BUCKET_CAPACITY);
        QCOMPARE(config->solarUrl, QUrl(DEFAULT_SOLAR_URL));
        QCOMPARE(config->potaUrl, QUrl(DEFAULT_POTA_URL));
    }

    void ConfigTest::missingToken_isAnError() {
        QString error;
        QVERIFY(!load({}, {}, &error).has_value());
        QVERIFY(error.contains("SEABIRD_TOKEN"));
    }

    void ConfigTest::commandLine_overridesEnvironment() {
        const auto config = load({"--url", "http://localhost:9000", "--log-level", "debug", "--max-in-flight", "3"},
                                 {{"SEABIRD_TOKEN", "t"}, {"SEABIRD_URL", "https://elsewhere.example"}, {"SEABIRD_LOG_LEVEL", "error"}});
        QVERIFY(config.has_value());
        QCOMPARE(config->coreUrl, QString("http://localhost:9000"));
        QCOMPARE(config->logLevel, LogLevel::Debug);
        QCOMPARE(config->maxInFlight, 3);

        const auto fromEnv = load({}, {{"SEABIRD_TOKEN", "t"}, {"SEABIRD_URL", "https://elsewhere.example"}, {"SEABIRD_LOG_LEVEL", "warning"}});
        QVERIFY(fromEnv.has_value());
        QCOMPARE(fromEnv->coreUrl, QString("https://elsewhere.example"));
        QCOMPARE(fromEnv->logLevel, LogLevel::Warn);
    }

    void ConfigTest::invalidNumbers_areRejected() {
        QString error;
        QVERIFY(!load({"--max-in-flight", "0"}, {{"SEABIRD_TOKEN", "t"}}, &error).has_value());
        QVERIFY(error.contains("max-in-flight"));

        QVERIFY(!load({"--command-timeout", "soon"}, {{"SEABIRD_TOKEN", "t"}}, &error).has_value());
        QVERIFY(!load({"--upstream-rate", "-1"}, {{"SEABIRD_TOKEN", "t"}}, &error).has_value());
        QVERIFY(!load({"--solar-url", "ftp://example.org/solar"}, {{"SEABIRD_TOKEN", "t"}}, &error).has_value());
        QVERIFY(!load({"--log-level", "loud"}, {{"SEABIRD_TOKEN", "t"}}, &error).has_value());
    }

    void ConfigTest::backoffCap_belowBase_isRejected() {
        QString error;
        QVERIFY(!load({"--backoff-base", "5000", "--backoff-cap", "1000"}, {{"SEABIRD_TOKEN", "t"}}, &error).has_value());
        QVERIFY(error.contains("backoff"));
    }

    void ConfigTest::logLevels_parse() {
        QCOMPARE(parseLogLevel("TRACE"), std::optional(LogLevel::Debug));
        QCOMPARE(parseLogLevel(" warn "), std::optional(LogLevel::Warn));
        QVERIFY(!parseLogLevel("verbose").has_value());
        QCOMPARE(logLevelName(LogLevel::Error), QString("error"));
    }

    void ConfigTest::errorKinds_haveStableNames() {
        QCOMPARE(errorKindName(ErrorKind::AuthInvalid), QString("auth.invalid"));
        QCOMPARE(errorKindName(ErrorKind::RateLimited), QString("rate_limited"));
        QCOMPARE(userMessage(ErrorKind::BadArguments), QString("bad arguments"));
        QVERIFY(isUserFacing(ErrorKind::Timeout));
        QVERIFY(!isUserFacing(ErrorKind::Internal));
        QVERIFY(!isUserFacing(ErrorKind::Transport));
    }

} // namespace sbr

int runConfigTests(int argc, char** argv) {
    sbr::ConfigTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_config.moc"
