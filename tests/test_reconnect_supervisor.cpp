#include "core/supervisor/ReconnectSupervisor.hpp"
#include "support/FakeSession.hpp"

#include <QtTest/QtTest>

#include <QPointer>
#include <QQueue>

namespace sbr::core {

    using test::FakeSession;

    namespace {

        using State = ReconnectSupervisor::State;

        // Hands out scripted sessions in order and keeps track of them
        struct SessionScript {
            QQueue<FakeSession::Script> scripts;
            FakeSession::Script         fallback = FakeSession::Script::Accept;
            QList<QPointer<FakeSession>> created;

            ReconnectSupervisor::SessionFactory factory() {
                return [this]() -> std::unique_ptr<CoreSession> {
                    const auto script  = scripts.isEmpty() ? fallback : scripts.dequeue();
                    auto       session = std::make_unique<FakeSession>(script, QString("session-%1").arg(created.size() + 1));
                    created << session.get();
                    return session;
                };
            }

            FakeSession* last() const {
                return created.isEmpty() ? nullptr : created.last().data();
            }
        };

        BackoffPolicy fastBackoff() {
            return BackoffPolicy(10, 40, [](int) { return 0; });
        }

        ReconnectSupervisor::Options options(int handshakeTimeoutMs = 1000, int livenessTimeoutMs = 60000, int livenessCheckMs = 1000) {
            ReconnectSupervisor::Options o;
            o.token              = "plugin-token";
            o.handshakeTimeoutMs = handshakeTimeoutMs;
            o.livenessTimeoutMs  = livenessTimeoutMs;
            o.livenessCheckMs    = livenessCheckMs;
            return o;
        }

        struct StateLog {
            QList<State> states;

            void         attach(ReconnectSupervisor& supervisor) {
                QObject::connect(&supervisor, &ReconnectSupervisor::stateChanged, &supervisor, [this](State s) { states << s; });
            }
        };

    } // namespace

    class ReconnectSupervisorTest : public QObject {
        Q_OBJECT

      private slots:
        void backoff_doublesUpToCap();
        void backoff_jitterStaysWithinQuarter();
        void start_reachesLive_withToken();
        void invalidToken_isFatal_withoutRetry();
        void transientFailures_backOffWithGrowingAttempts();
        void disconnect_reconnects_andResetsAttempt();
        void handshakeTimeout_countsAsFailedAttempt();
        void silentLiveSession_isReplaced();
        void envelopes_areForwardedFromLiveSession();
        void stop_returnsToIdle_andClosesSession();
        void destruction_closesAndReclaimsLiveSession();
    };

    void ReconnectSupervisorTest::backoff_doublesUpToCap() {
        BackoffPolicy policy(500, 60000, [](int) { return 0; });
        QCOMPARE(policy.delayMs(0), 500);
        QCOMPARE(policy.delayMs(1), 1000);
        QCOMPARE(policy.delayMs(4), 8000);
        QCOMPARE(policy.delayMs(7), 60000);
        QCOMPARE(policy.delayMs(40), 60000);
        QCOMPARE(policy.maxDelayMs(), 75000);
    }

    void ReconnectSupervisorTest::backoff_jitterStaysWithinQuarter() {
        BackoffPolicy policy(500, 60000);
        for (int attempt = 0; attempt < 20; ++attempt) {
            const int base  = policy.baseDelayMs(attempt);
            const int delay = policy.delayMs(attempt);
            QVERIFY(delay >= base);
            QVERIFY(delay <= base + base / 4);
            QVERIFY(delay <= policy.maxDelayMs());
        }
    }

    void ReconnectSupervisorTest::start_reachesLive_withToken() {
        SessionScript       script;
        ReconnectSupervisor supervisor(script.factory(), fastBackoff(), options());
        QSignalSpy          live(&supervisor, &ReconnectSupervisor::sessionLive);

        supervisor.start();

        QCOMPARE(supervisor.state(), State::Live);
        QCOMPARE(live.count(), 1);
        QCOMPARE(script.created.size(), 1);
        QCOMPARE(script.last()->openedWith, QString("plugin-token"));
        QCOMPARE(supervisor.liveSession(), static_cast<CoreSession*>(script.last()));
        QCOMPARE(supervisor.liveSessionId(), QString("session-1"));
    }

    void ReconnectSupervisorTest::invalidToken_isFatal_withoutRetry() {
        SessionScript script;
        script.fallback = FakeSession::Script::RejectInvalid;

        ReconnectSupervisor supervisor(script.factory(), fastBackoff(), options());
        QSignalSpy          fatal(&supervisor, &ReconnectSupervisor::fatalError);
        QSignalSpy          backoff(&supervisor, &ReconnectSupervisor::backoffScheduled);

        supervisor.start();

        QCOMPARE(supervisor.state(), State::Fatal);
        QCOMPARE(fatal.count(), 1);
        QTest::qWait(100);
        QCOMPARE(script.created.size(), 1);
        QCOMPARE(backoff.count(), 0);
        QVERIFY(supervisor.liveSession() == nullptr);

        // Fatal is terminal
        supervisor.start();
        supervisor.stop();
        QCOMPARE(supervisor.state(), State::Fatal);
    }

    void ReconnectSupervisorTest::transientFailures_backOffWithGrowingAttempts() {
        SessionScript script;
        script.scripts << FakeSession::Script::RejectTransient << FakeSession::Script::DropOnOpen << FakeSession::Script::RejectTransient
                       << FakeSession::Script::RejectTransient;

        ReconnectSupervisor supervisor(script.factory(), fastBackoff(), options());
        QList<int>          attempts;
        QList<int>          delays;
        connect(&supervisor, &ReconnectSupervisor::backoffScheduled, this, [&](int attempt, int delayMs) {
            attempts << attempt;
            delays << delayMs;
        });

        supervisor.start();
        QTRY_COMPARE(supervisor.state(), State::Live);

        QCOMPARE(attempts, (QList<int>{1, 2, 3, 4}));
        QCOMPARE(delays, (QList<int>{20, 40, 40, 40}));
        QCOMPARE(script.created.size(), 5);
        QCOMPARE(supervisor.attempt(), 0);
    }

    void ReconnectSupervisorTest::disconnect_reconnects_andResetsAttempt() {
        SessionScript script;
        script.scripts << FakeSession::Script::Accept << FakeSession::Script::RejectTransient << FakeSession::Script::Accept;

        ReconnectSupervisor supervisor(script.factory(), fastBackoff(), options());
        StateLog            log;
        log.attach(supervisor);
        QSignalSpy lost(&supervisor, &ReconnectSupervisor::sessionLost);

        supervisor.start();
        QCOMPARE(supervisor.state(), State::Live);

        script.last()->drop("stream reset by peer");
        QCOMPARE(lost.count(), 1);
        QCOMPARE(lost.first().at(0).toString(), QString("session-1"));
        QCOMPARE(supervisor.state(), State::Backoff);
        QVERIFY(supervisor.liveSession() == nullptr);

        QTRY_COMPARE(supervisor.state(), State::Live);
        QCOMPARE(supervisor.attempt(), 0);
        QCOMPARE(supervisor.liveSessionId(), QString("session-3"));

        const QList<State> expected{State::Connecting, State::Live,    State::Backoff, State::Connecting,
                                    State::Backoff,    State::Connecting, State::Live};
        QVERIFY(log.states == expected);
    }

    void ReconnectSupervisorTest::handshakeTimeout_countsAsFailedAttempt() {
        SessionScript script;
        script.scripts << FakeSession::Script::Silent;

        ReconnectSupervisor supervisor(script.factory(), fastBackoff(), options(30));
        QSignalSpy          backoff(&supervisor, &ReconnectSupervisor::backoffScheduled);

        supervisor.start();
        QCOMPARE(supervisor.state(), State::Connecting);

        QTRY_COMPARE(backoff.count(), 1);
        QCOMPARE(backoff.first().at(0).toInt(), 1);
        QTRY_COMPARE(supervisor.state(), State::Live);
        QCOMPARE(script.created.size(), 2);
        QVERIFY(script.created.first().isNull() || script.created.first()->state() == CoreSession::State::Closed);
    }

    void ReconnectSupervisorTest::silentLiveSession_isReplaced() {
        qint64        now = 0;
        SessionScript script;

        ReconnectSupervisor::SessionFactory factory = [&]() -> std::unique_ptr<CoreSession> {
            auto session = std::make_unique<FakeSession>(FakeSession::Script::Accept, QString("session-%1").arg(script.created.size() + 1), [&now] { return now; });
            script.created << session.get();
            return session;
        };

        ReconnectSupervisor supervisor(factory, fastBackoff(), options(1000, 100, 10));
        QSignalSpy          lost(&supervisor, &ReconnectSupervisor::sessionLost);

        supervisor.start();
        QCOMPARE(supervisor.state(), State::Live);

        QTest::qWait(40);
        QCOMPARE(lost.count(), 0);

        now = 500;
        QTRY_COMPARE(lost.count(), 1);
        QTRY_COMPARE(supervisor.liveSessionId(), QString("session-2"));
    }

    void ReconnectSupervisorTest::envelopes_areForwardedFromLiveSession() {
        SessionScript       script;
        ReconnectSupervisor supervisor(script.factory(), fastBackoff(), options());
        QList<CommandEnvelope> received;
        connect(&supervisor, &ReconnectSupervisor::envelopeReceived, this, [&received](const CommandEnvelope& e) { received << e; });

        supervisor.start();
        script.last()->receive(test::makeEnvelope("c1", "bands"));

        QCOMPARE(received.size(), 1);
        QCOMPARE(received.first().sessionId, QString("session-1"));
    }

    void ReconnectSupervisorTest::stop_returnsToIdle_andClosesSession() {
        SessionScript       script;
        ReconnectSupervisor supervisor(script.factory(), fastBackoff(), options());

        supervisor.start();
        QPointer<FakeSession> session = script.last();
        QVERIFY(session);

        supervisor.stop();
        QCOMPARE(supervisor.state(), State::Idle);
        QVERIFY(session.isNull() || session->state() == CoreSession::State::Closed);
        QTRY_VERIFY(session.isNull());

        QTest::qWait(60);
        QCOMPARE(script.created.size(), 1);
    }

    void ReconnectSupervisorTest::destruction_closesAndReclaimsLiveSession() {
        SessionScript         script;
        QPointer<FakeSession> session;
        QStringList           closeReasons;
        bool                  destroyed = false;

        {
            ReconnectSupervisor supervisor(script.factory(), fastBackoff(), options());
            supervisor.start();
            QCOMPARE(supervisor.state(), State::Live);

            session = script.last();
            QVERIFY(session);
            QVERIFY(session->parent() == &supervisor);
            QObject::connect(session.data(), &CoreSession::closed, session.data(), [&closeReasons](const QString& reason) { closeReasons << reason; });
            QObject::connect(session.data(), &QObject::destroyed, session.data(), [&destroyed]() { destroyed = true; });
        }

        QVERIFY(destroyed);
        QVERIFY(session.isNull());
        QCOMPARE(closeReasons, QStringList{"closed locally"});
        QCOMPARE(script.created.size(), 1);
    }

} // namespace sbr::core

int runReconnectSupervisorTests(int argc, char** argv) {
    sbr::core::ReconnectSupervisorTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_reconnect_supervisor.moc"
