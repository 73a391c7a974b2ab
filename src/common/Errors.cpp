#include "Errors.hpp"

namespace sbr {

    QString errorKindName(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Transport: return "transport";
            case ErrorKind::AuthTransient: return "auth.transient";
            case ErrorKind::AuthInvalid: return "auth.invalid";
            case ErrorKind::RateLimited: return "rate_limited";
            case ErrorKind::UpstreamUnavailable: return "upstream_unavailable";
            case ErrorKind::UnknownCommand: return "unknown_command";
            case ErrorKind::BadArguments: return "bad_arguments";
            case ErrorKind::Internal: return "internal";
            case ErrorKind::Timeout: return "timeout";
        }
        return "unknown";
    }

    QString userMessage(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::RateLimited: return "radio data is being requested too often, try again later";
            case ErrorKind::UpstreamUnavailable: return "radio data service unavailable";
            case ErrorKind::UnknownCommand: return "unknown command";
            case ErrorKind::BadArguments: return "bad arguments";
            case ErrorKind::Timeout: return "command timed out";
            case ErrorKind::Transport:
            case ErrorKind::AuthTransient:
            case ErrorKind::AuthInvalid:
            case ErrorKind::Internal: return "internal error";
        }
        return "internal error";
    }

    bool isUserFacing(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::RateLimited:
            case ErrorKind::UpstreamUnavailable:
            case ErrorKind::UnknownCommand:
            case ErrorKind::BadArguments:
            case ErrorKind::Timeout: return true;
            default: return false;
        }
    }

} // namespace sbr
