#include "GrpcSession.hpp"

#include "../../common/Constants.hpp"
#include "../../common/Logging.hpp"
#include "WireCodec.hpp"

#include <QMetaObject>

#include <utility>

namespace sbr::core {

    namespace pb = seabird::plugin::v1;

    namespace {

        ErrorKind classifyStatus(const grpc::Status& status) {
            switch (status.error_code()) {
                case grpc::StatusCode::UNAUTHENTICATED:
                case grpc::StatusCode::PERMISSION_DENIED: return ErrorKind::AuthInvalid;
                default: return ErrorKind::Transport;
            }
        }

        QString describeStatus(const grpc::Status& status) {
            return QString("grpc status %1: %2").arg(static_cast<int>(status.error_code())).arg(QString::fromStdString(status.error_message()));
        }

    } // namespace

    GrpcSession::GrpcSession(Options options, QObject* parent) : CoreSession(parent), m_options(std::move(options)) {}

    GrpcSession::~GrpcSession() {
        m_cancelled = true;
        m_context.TryCancel();
        closeQueue();

        if (m_reader.joinable()) {
            m_reader.join();
        }
    }

    void GrpcSession::open(const QString& token) {
        if (m_reader.joinable()) {
            qCWarning(lcSession) << "open() called twice on the same session";
            return;
        }

        std::shared_ptr<grpc::ChannelCredentials> credentials =
            m_options.endpoint.tls ? grpc::SslCredentials(grpc::SslCredentialsOptions()) : grpc::InsecureChannelCredentials();

        grpc::ChannelArguments args;
        args.SetUserAgentPrefix(QString("%1/%2").arg(m_options.pluginName, m_options.pluginVersion).toStdString());
        if (m_options.keepaliveMs > 0) {
            args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, m_options.keepaliveMs);
            args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);
        }

        m_channel = grpc::CreateCustomChannel(m_options.endpoint.target.toStdString(), credentials, args);
        m_stub    = pb::PluginCore::NewStub(m_channel);
        m_context.AddMetadata("authorization", "Bearer " + token.toStdString());

        qCInfo(lcSession) << "connecting to" << m_options.endpoint.target << (m_options.endpoint.tls ? "(tls)" : "(plaintext)");
        m_reader = std::thread([this]() { runStream(); });
    }

    std::optional<GrpcSession::Endpoint> GrpcSession::endpointFromUrl(const QUrl& url) {
        if (!url.isValid() || url.host().isEmpty()) {
            return std::nullopt;
        }

        Endpoint      endpoint;
        const QString scheme = url.scheme().toLower();
        if (scheme == "https" || scheme == "grpcs") {
            endpoint.tls = true;
        } else if (scheme == "http" || scheme == "grpc") {
            endpoint.tls = false;
        } else {
            return std::nullopt;
        }

        endpoint.target = QString("%1:%2").arg(url.host()).arg(url.port(endpoint.tls ? 443 : 80));
        return endpoint;
    }

    bool GrpcSession::writeResponse(const ResponseEnvelope& response) {
        return enqueue(wire::encodeReply(response));
    }

    void GrpcSession::shutdownStream() {
        // Cancelling is lock-free and unblocks whatever the reader or writer is waiting on
        m_cancelled = true;
        m_context.TryCancel();
        closeQueue();

        // Never opened: nothing will ever report the end of the stream
        if (!m_reader.joinable()) {
            finish("closed before open");
        }
    }

    void GrpcSession::runStream() {
        if (m_cancelled) {
            post([this]() { finish("cancelled before connect"); });
            return;
        }

        // Blocks until the call is started or cancelled
        m_stream = m_stub->Attach(&m_context);

        if (!m_stream->Write(wire::encodeHello(m_options.pluginName, m_options.pluginVersion, m_options.commands))) {
            const grpc::Status status = finishStream();
            post([this, kind = classifyStatus(status), message = describeStatus(status)]() { failHandshake(kind, message); });
            return;
        }

        pb::CoreFrame frame;
        if (!m_stream->Read(&frame)) {
            const grpc::Status status = finishStream();
            post([this, kind = classifyStatus(status), message = describeStatus(status)]() { failHandshake(kind, message); });
            return;
        }

        if (frame.has_rejected()) {
            const ErrorKind kind   = frame.rejected().retryable() ? ErrorKind::AuthTransient : ErrorKind::AuthInvalid;
            const QString   reason = QString::fromStdString(frame.rejected().reason());
            m_context.TryCancel();
            finishStream();
            post([this, kind, reason]() { failHandshake(kind, reason); });
            return;
        }

        if (!frame.has_welcome()) {
            m_context.TryCancel();
            finishStream();
            post([this]() { failHandshake(ErrorKind::Transport, "core did not answer the handshake with a welcome"); });
            return;
        }

        const QString sessionId = QString::fromStdString(frame.welcome().session_id());
        startWriter();
        post([this, sessionId]() { markAuthenticated(sessionId); });

        while (m_stream->Read(&frame)) {
            switch (frame.frame_case()) {
                case pb::CoreFrame::kCommand: {
                    CommandEnvelope envelope = wire::decodeInvocation(frame.command(), sessionId);
                    if (envelope.correlationId.isEmpty()) {
                        qCWarning(lcSession) << "core sent command" << envelope.command << "without a correlation id; it cannot be answered";
                        break;
                    }
                    post([this, envelope = std::move(envelope)]() mutable { deliver(std::move(envelope)); });
                    break;
                }

                case pb::CoreFrame::kPing:
                    touch();
                    if (!enqueue(wire::encodePong(frame.ping().nonce()))) {
                        qCWarning(lcSession) << "failed to queue pong on session" << sessionId;
                    }
                    break;

                default: qCDebug(lcSession) << "ignoring unexpected frame type" << static_cast<int>(frame.frame_case()); break;
            }
        }

        stopWriter();
        const grpc::Status status = finishStream();
        const QString      reason = status.ok() ? QString("stream ended by core") : describeStatus(status);
        post([this, reason]() { finish(reason); });
    }

    void GrpcSession::runWriter() {
        for (;;) {
            pb::PluginFrame frame;
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_queueReady.wait(lock, [this]() { return !m_writerOpen || !m_outbound.empty(); });
                if (!m_writerOpen) {
                    return;
                }
                frame = std::move(m_outbound.front());
                m_outbound.pop_front();
            }

            if (!m_stream->Write(frame)) {
                qCWarning(lcSession) << "write failed; cancelling the stream";
                closeQueue();
                m_context.TryCancel();
                return;
            }
        }
    }

    bool GrpcSession::enqueue(pb::PluginFrame frame) {
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            if (!m_writerOpen) {
                return false;
            }
            if (m_outbound.size() >= OUTBOUND_QUEUE_LIMIT) {
                qCWarning(lcSession) << "outbound queue full," << m_outbound.size() << "frames waiting";
                return false;
            }
            m_outbound.push_back(std::move(frame));
        }
        m_queueReady.notify_one();
        return true;
    }

    void GrpcSession::startWriter() {
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_writerOpen = !m_cancelled;
        }
        m_writer = std::thread([this]() { runWriter(); });
    }

    void GrpcSession::stopWriter() {
        closeQueue();
        if (m_writer.joinable()) {
            m_writer.join();
        }
    }

    void GrpcSession::closeQueue() {
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_writerOpen = false;
            m_outbound.clear();
        }
        m_queueReady.notify_all();
    }

    grpc::Status GrpcSession::finishStream() {
        if (!m_stream) {
            return grpc::Status(grpc::StatusCode::CANCELLED, "stream already finished");
        }

        grpc::Status status = m_stream->Finish();
        m_stream.reset();
        return status;
    }

    void GrpcSession::post(std::function<void()> fn) {
        QMetaObject::invokeMethod(this, std::move(fn), Qt::QueuedConnection);
    }

} // namespace sbr::core
