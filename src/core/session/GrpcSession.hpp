#pragma once

#include "CoreSession.hpp"

#include <seabird_plugin.grpc.pb.h>

#include <grpcpp/grpcpp.h>

#include <QList>
#include <QUrl>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sbr::core {

    // CoreSession over the PluginCore.Attach bidirectional gRPC stream.
    // A reader thread performs the blocking handshake and Read() loop and
    // posts everything it learns back to the owning thread. Outbound frames
    // are queued to a writer thread, so the owning thread never blocks on
    // gRPC. Only the reader and writer threads touch the stream itself.
    class GrpcSession final : public CoreSession {
        Q_OBJECT

      public:
        struct Endpoint {
            QString target; // host:port
            bool    tls = true;
        };

        struct Options {
            Endpoint           endpoint;
            QString            pluginName;
            QString            pluginVersion;
            QList<CommandInfo> commands;
            int                keepaliveMs = 0;
        };

        explicit GrpcSession(Options options, QObject* parent = nullptr);
        ~GrpcSession() override;

        void                           open(const QString& token) override;

        // https://host -> host:443 over TLS, http://host:port -> plaintext
        static std::optional<Endpoint> endpointFromUrl(const QUrl& url);

      protected:
        bool writeResponse(const ResponseEnvelope& response) override;
        void shutdownStream() override;

      private:
        using Stream = grpc::ClientReaderWriter<seabird::plugin::v1::PluginFrame, seabird::plugin::v1::CoreFrame>;

        void                                                   runStream();
        void                                                   runWriter();
        bool                                                   enqueue(seabird::plugin::v1::PluginFrame frame);
        void                                                   startWriter();
        void                                                   stopWriter();
        void                                                   closeQueue();
        grpc::Status                                           finishStream();
        void                                                   post(std::function<void()> fn);

        Options                                                m_options;
        std::shared_ptr<grpc::Channel>                         m_channel;
        std::unique_ptr<seabird::plugin::v1::PluginCore::Stub> m_stub;
        grpc::ClientContext                                    m_context;
        std::unique_ptr<Stream>                                m_stream;
        std::atomic<bool>                                      m_cancelled{false};

        std::mutex                                             m_queueMutex;
        std::condition_variable                                m_queueReady;
        std::deque<seabird::plugin::v1::PluginFrame>           m_outbound;
        bool                                                   m_writerOpen = false;

        std::thread                                            m_reader;
        std::thread                                            m_writer; // started and joined by the reader thread
    };

} // namespace sbr::core
