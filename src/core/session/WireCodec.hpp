#pragma once

#include "../Envelope.hpp"

#include <seabird_plugin.pb.h>

#include <QList>
#include <QString>

namespace sbr::core::wire {

    namespace pb = seabird::plugin::v1;

    pb::PluginFrame               encodeHello(const QString& pluginName, const QString& pluginVersion, const QList<CommandInfo>& commands);
    pb::PluginFrame               encodeReply(const ResponseEnvelope& response);
    pb::PluginFrame               encodePong(quint64 nonce);

    CommandEnvelope               decodeInvocation(const pb::CommandInvocation& invocation, const QString& sessionId);

    pb::CommandError::Kind        toWireKind(ErrorKind kind);

} // namespace sbr::core::wire
