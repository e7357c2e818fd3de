#pragma once

#include <toolhub/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace toolhub::daemon {

// Classification of daemon socket failures, carried as a "[ipc:<kind>] " prefix in
// Error.message so it survives the plain Result<T> plumbing.
enum class IpcFailureKind {
    SocketMissing,
    PathNotSocket,
    Refused,
    Timeout,
    ResetOrBrokenPipe,
    Eof,
    Protocol,
    Other
};

inline constexpr std::string_view kIpcFailurePrefix = "[ipc:";

inline constexpr std::string_view to_string(IpcFailureKind k) {
    switch (k) {
        case IpcFailureKind::SocketMissing:
            return "socket_missing";
        case IpcFailureKind::PathNotSocket:
            return "path_not_socket";
        case IpcFailureKind::Refused:
            return "refused";
        case IpcFailureKind::Timeout:
            return "timeout";
        case IpcFailureKind::ResetOrBrokenPipe:
            return "reset_or_broken_pipe";
        case IpcFailureKind::Eof:
            return "eof";
        case IpcFailureKind::Protocol:
            return "protocol";
        case IpcFailureKind::Other:
            return "other";
    }
    return "other";
}

inline std::string formatIpcFailure(IpcFailureKind kind, std::string_view detail) {
    std::string out;
    out.reserve(kIpcFailurePrefix.size() + 24 + detail.size());
    out.append(kIpcFailurePrefix);
    out.append(to_string(kind));
    out.append("] ");
    out.append(detail);
    return out;
}

inline Error makeIpcError(IpcFailureKind kind, std::string_view detail) {
    ErrorCode code = ErrorCode::NetworkError;
    if (kind == IpcFailureKind::Timeout) {
        code = ErrorCode::Timeout;
    } else if (kind == IpcFailureKind::Protocol) {
        code = ErrorCode::InvalidData;
    }
    return Error{code, formatIpcFailure(kind, detail)};
}

inline std::optional<IpcFailureKind> parseIpcFailureKind(std::string_view message) {
    if (!message.starts_with(kIpcFailurePrefix)) {
        return std::nullopt;
    }
    auto close = message.find(']');
    auto kindStart = kIpcFailurePrefix.size();
    if (close == std::string_view::npos || close <= kindStart) {
        return std::nullopt;
    }
    auto kind = message.substr(kindStart, close - kindStart);
    for (auto candidate :
         {IpcFailureKind::SocketMissing, IpcFailureKind::PathNotSocket, IpcFailureKind::Refused,
          IpcFailureKind::Timeout, IpcFailureKind::ResetOrBrokenPipe, IpcFailureKind::Eof,
          IpcFailureKind::Protocol, IpcFailureKind::Other}) {
        if (kind == to_string(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

// Message without the classification prefix
inline std::string_view stripIpcFailurePrefix(std::string_view message) {
    if (!parseIpcFailureKind(message)) {
        return message;
    }
    auto rest = message.substr(message.find(']') + 1);
    if (rest.starts_with(' ')) {
        rest.remove_prefix(1);
    }
    return rest;
}

// Nobody is listening: the socket file is absent or the connect was refused
inline bool isDaemonNotRunning(const Error& error) {
    auto kind = parseIpcFailureKind(error.message);
    return kind && (*kind == IpcFailureKind::SocketMissing || *kind == IpcFailureKind::Refused);
}

} // namespace toolhub::daemon
