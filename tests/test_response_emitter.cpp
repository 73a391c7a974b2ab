#include "core/emitter/ResponseEmitter.hpp"
#include "support/FakeSession.hpp"

#include <QtTest/QtTest>

namespace sbr::core {

    using test::FakeSession;

    namespace {

        ResponseEnvelope response(const QString& id, const QString& sessionId) {
            ResponseEnvelope r;
            r.correlationId = id;
            r.sessionId     = sessionId;
            r.result        = CommandResult::success({"ok"});
            return r;
        }

    } // namespace

    class ResponseEmitterTest : public QObject {
        Q_OBJECT

      private slots:
        void deliversToMatchingLiveSession();
        void dropsWhenNoSessionIsLive();
        void dropsResponsesOfAPreviousSession();
        void dropsOnWriteFailure();
    };

    void ResponseEmitterTest::deliversToMatchingLiveSession() {
        FakeSession session(FakeSession::Script::Accept, "s-1");
        session.open("token");

        ResponseEmitter emitter([&session]() -> CoreSession* { return &session; });
        QVERIFY(emitter.emitResponse(response("c1", "s-1")));
        QVERIFY(emitter.emitResponse(response("c2", "s-1")));

        QCOMPARE(session.written.size(), 2);
        QCOMPARE(session.written.at(1).correlationId, QString("c2"));
        QCOMPARE(emitter.stats().delivered, quint64(2));
        QCOMPARE(emitter.stats().dropped, quint64(0));
    }

    void ResponseEmitterTest::dropsWhenNoSessionIsLive() {
        ResponseEmitter emitter([]() -> CoreSession* { return nullptr; });
        QSignalSpy      dropped(&emitter, &ResponseEmitter::responseDropped);

        QVERIFY(!emitter.emitResponse(response("c1", "s-1")));
        QCOMPARE(dropped.count(), 1);
        QCOMPARE(dropped.first().at(0).toString(), QString("c1"));
        QCOMPARE(emitter.stats().dropped, quint64(1));
    }

    void ResponseEmitterTest::dropsResponsesOfAPreviousSession() {
        FakeSession session(FakeSession::Script::Accept, "s-2");
        session.open("token");

        ResponseEmitter emitter([&session]() -> CoreSession* { return &session; });
        QSignalSpy      dropped(&emitter, &ResponseEmitter::responseDropped);

        QVERIFY(!emitter.emitResponse(response("old", "s-1")));
        QVERIFY(session.written.isEmpty());
        QCOMPARE(dropped.count(), 1);
        QVERIFY(dropped.first().at(1).toString().contains("s-1"));
    }

    void ResponseEmitterTest::dropsOnWriteFailure() {
        FakeSession session(FakeSession::Script::Accept, "s-1");
        session.open("token");
        session.failWrites = true;

        ResponseEmitter emitter([&session]() -> CoreSession* { return &session; });
        QVERIFY(!emitter.emitResponse(response("c1", "s-1")));
        QCOMPARE(emitter.stats().dropped, quint64(1));
        QCOMPARE(emitter.stats().delivered, quint64(0));
    }

} // namespace sbr::core

int runResponseEmitterTests(int argc, char** argv) {
    sbr::core::ResponseEmitterTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_response_emitter.moc"
