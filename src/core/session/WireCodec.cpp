#include "WireCodec.hpp"

namespace sbr::core::wire {

    namespace {

        std::string utf8(const QString& s) {
            return s.toStdString();
        }

        QString fromUtf8(const std::string& s) {
            return QString::fromStdString(s);
        }

    } // namespace

    pb::PluginFrame encodeHello(const QString& pluginName, const QString& pluginVersion, const QList<CommandInfo>& commands) {
        pb::PluginFrame frame;
        pb::Hello*      hello = frame.mutable_hello();
        hello->set_plugin_name(utf8(pluginName));
        hello->set_plugin_version(utf8(pluginVersion));

        for (const CommandInfo& info : commands) {
            pb::CommandMetadata* meta = hello->add_commands();
            meta->set_name(utf8(info.name));
            meta->set_short_help(utf8(info.shortHelp));
            meta->set_full_help(utf8(info.fullHelp));
            meta->set_min_args(static_cast<quint32>(info.minArgs));
            meta->set_max_args(static_cast<quint32>(info.maxArgs));
        }
        return frame;
    }

    pb::PluginFrame encodeReply(const ResponseEnvelope& response) {
        pb::PluginFrame    frame;
        pb::CommandReply*  reply = frame.mutable_reply();
        reply->set_correlation_id(utf8(response.correlationId));
        reply->set_emitted_at_ms(response.emittedAtMs);

        if (response.result.ok()) {
            pb::CommandOutput* output = reply->mutable_output();
            for (const QString& line : response.result.lines) {
                output->add_lines(utf8(line));
            }
        } else {
            pb::CommandError* error = reply->mutable_error();
            error->set_kind(toWireKind(response.result.error->kind));
            error->set_message(utf8(response.result.error->message));
        }
        return frame;
    }

    pb::PluginFrame encodePong(quint64 nonce) {
        pb::PluginFrame frame;
        frame.mutable_pong()->set_nonce(nonce);
        return frame;
    }

    CommandEnvelope decodeInvocation(const pb::CommandInvocation& invocation, const QString& sessionId) {
        CommandEnvelope envelope;
        envelope.correlationId = fromUtf8(invocation.correlation_id());
        envelope.command       = fromUtf8(invocation.command()).trimmed().toLower();
        envelope.sessionId     = sessionId;

        envelope.args.reserve(invocation.args_size());
        for (const std::string& arg : invocation.args()) {
            envelope.args.append(fromUtf8(arg));
        }

        if (invocation.has_source()) {
            envelope.source.channelId = fromUtf8(invocation.source().channel_id());
            if (invocation.source().has_user()) {
                envelope.source.userId      = fromUtf8(invocation.source().user().id());
                envelope.source.displayName = fromUtf8(invocation.source().user().display_name());
            }
        }

        for (const auto& [key, value] : invocation.context()) {
            envelope.context.insert(fromUtf8(key), fromUtf8(value));
        }
        return envelope;
    }

    pb::CommandError::Kind toWireKind(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::UnknownCommand: return pb::CommandError::KIND_UNKNOWN_COMMAND;
            case ErrorKind::BadArguments: return pb::CommandError::KIND_BAD_ARGUMENTS;
            case ErrorKind::RateLimited: return pb::CommandError::KIND_RATE_LIMITED;
            case ErrorKind::UpstreamUnavailable: return pb::CommandError::KIND_UPSTREAM_UNAVAILABLE;
            case ErrorKind::Timeout: return pb::CommandError::KIND_TIMEOUT;
            case ErrorKind::Internal:
            case ErrorKind::Transport:
            case ErrorKind::AuthTransient:
            case ErrorKind::AuthInvalid: return pb::CommandError::KIND_INTERNAL;
        }
        return pb::CommandError::KIND_UNSPECIFIED;
    }

} // namespace sbr::core::wire
