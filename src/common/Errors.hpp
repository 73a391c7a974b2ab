#pragma once

#include <QMetaType>
#include <QString>

namespace sbr {

    enum class ErrorKind {
        Transport,
        AuthTransient,
        AuthInvalid,
        RateLimited,
        UpstreamUnavailable,
        UnknownCommand,
        BadArguments,
        Internal,
        Timeout
    };

    struct Error {
        ErrorKind kind = ErrorKind::Internal;
        QString   message;
    };

    // Stable identifier used in logs and on the wire
    [[nodiscard]] QString errorKindName(ErrorKind kind);

    // Text shown to the chat user for command-level errors
    [[nodiscard]] QString userMessage(ErrorKind kind);

    // Errors that are the user's to retry, not operator faults
    [[nodiscard]] bool isUserFacing(ErrorKind kind);

} // namespace sbr

Q_DECLARE_METATYPE(sbr::ErrorKind)
