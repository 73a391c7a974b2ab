#include "core/session/WireCodec.hpp"

#include <QtTest/QtTest>

namespace sbr::core {

    namespace pb = wire::pb;

    class WireCodecTest : public QObject {
        Q_OBJECT

      private slots:
        void hello_listsEveryCommand();
        void invocation_decodesSourceArgsAndContext();
        void invocation_withoutUser_hasEmptyDisplayName();
        void reply_carriesOutputLines();
        void reply_carriesErrorKindAndMessage();
        void errorKinds_mapToWireKinds();
        void pong_echoesNonce();
    };

    void WireCodecTest::hello_listsEveryCommand() {
        CommandInfo bands{"bands", "show HAM RF band conditions", "", "bands", 0, 0};
        CommandInfo pota{"pota", "find most recent POTA activation", "full", "pota <band> [mode]", 1, 2};

        const pb::PluginFrame frame = wire::encodeHello("seabird-radio", "1.0.0", {bands, pota});
        QVERIFY(frame.has_hello());

        const auto& hello = frame.hello();
        QCOMPARE(QString::fromStdString(hello.plugin_name()), QString("seabird-radio"));
        QCOMPARE(QString::fromStdString(hello.plugin_version()), QString("1.0.0"));
        QCOMPARE(hello.commands_size(), 2);
        QCOMPARE(QString::fromStdString(hello.commands(1).name()), QString("pota"));
        QCOMPARE(hello.commands(1).min_args(), 1u);
        QCOMPARE(hello.commands(1).max_args(), 2u);
        QCOMPARE(QString::fromStdString(hello.commands(0).short_help()), QString("show HAM RF band conditions"));
    }

    void WireCodecTest::invocation_decodesSourceArgsAndContext() {
        pb::CommandInvocation invocation;
        invocation.set_correlation_id("corr-9");
        invocation.set_command(" POTA ");
        invocation.add_args("20m");
        invocation.add_args("FT8");
        invocation.mutable_source()->set_channel_id("#hamradio");
        invocation.mutable_source()->mutable_user()->set_id("u-1");
        invocation.mutable_source()->mutable_user()->set_display_name("K1ABC ü");
        (*invocation.mutable_context())["network"] = "libera";

        const CommandEnvelope envelope = wire::decodeInvocation(invocation, "s-3");

        QCOMPARE(envelope.correlationId, QString("corr-9"));
        QCOMPARE(envelope.command, QString("pota"));
        QCOMPARE(envelope.args, (QStringList{"20m", "FT8"}));
        QCOMPARE(envelope.source.channelId, QString("#hamradio"));
        QCOMPARE(envelope.source.displayName, QString::fromUtf8("K1ABC ü"));
        QCOMPARE(envelope.context.value("network"), QString("libera"));
        QCOMPARE(envelope.sessionId, QString("s-3"));
    }

    void WireCodecTest::invocation_withoutUser_hasEmptyDisplayName() {
        pb::CommandInvocation invocation;
        invocation.set_correlation_id("c1");
        invocation.set_command("bands");
        invocation.mutable_source()->set_channel_id("#radio");

        const CommandEnvelope envelope = wire::decodeInvocation(invocation, "s-1");
        QVERIFY(envelope.source.displayName.isEmpty());
        QVERIFY(replyPrefix(envelope.source).isEmpty());
    }

    void WireCodecTest::reply_carriesOutputLines() {
        CommandEnvelope envelope;
        envelope.correlationId = "c1";
        envelope.sessionId     = "s-1";

        const auto      response = ResponseEnvelope::answer(envelope, CommandResult::success({"line one", "line two"}), 42);
        const auto      frame    = wire::encodeReply(response);

        QVERIFY(frame.has_reply());
        QCOMPARE(QString::fromStdString(frame.reply().correlation_id()), QString("c1"));
        QVERIFY(frame.reply().emitted_at_ms() == 42);
        QVERIFY(frame.reply().has_output());
        QCOMPARE(frame.reply().output().lines_size(), 2);
        QCOMPARE(QString::fromStdString(frame.reply().output().lines(1)), QString("line two"));
    }

    void WireCodecTest::reply_carriesErrorKindAndMessage() {
        CommandEnvelope envelope;
        envelope.correlationId = "c2";

        const auto response = ResponseEnvelope::answer(envelope, CommandResult::failure(ErrorKind::RateLimited), 0);
        const auto frame    = wire::encodeReply(response);

        QVERIFY(frame.reply().has_error());
        QCOMPARE(frame.reply().error().kind(), pb::CommandError::KIND_RATE_LIMITED);
        QCOMPARE(QString::fromStdString(frame.reply().error().message()), userMessage(ErrorKind::RateLimited));
    }

    void WireCodecTest::errorKinds_mapToWireKinds() {
        QCOMPARE(wire::toWireKind(ErrorKind::UnknownCommand), pb::CommandError::KIND_UNKNOWN_COMMAND);
        QCOMPARE(wire::toWireKind(ErrorKind::BadArguments), pb::CommandError::KIND_BAD_ARGUMENTS);
        QCOMPARE(wire::toWireKind(ErrorKind::UpstreamUnavailable), pb::CommandError::KIND_UPSTREAM_UNAVAILABLE);
        QCOMPARE(wire::toWireKind(ErrorKind::Timeout), pb::CommandError::KIND_TIMEOUT);
        QCOMPARE(wire::toWireKind(ErrorKind::Internal), pb::CommandError::KIND_INTERNAL);
        QCOMPARE(wire::toWireKind(ErrorKind::Transport), pb::CommandError::KIND_INTERNAL);
    }

    void WireCodecTest::pong_echoesNonce() {
        const auto frame = wire::encodePong(77);
        QVERIFY(frame.has_pong());
        QVERIFY(frame.pong().nonce() == 77u);
    }

} // namespace sbr::core

int runWireCodecTests(int argc, char** argv) {
    sbr::core::WireCodecTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_wire_codec.moc"
