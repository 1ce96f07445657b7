#pragma once

#include "transport.hpp"
#include <string>
#include <string_view>

namespace reqlite {

enum class HttpError {
    Network,
    Dns,
    Tls,
    InvalidUrl,
    UnsupportedScheme,
    BufferTooSmall,
    MalformedStatus,
    MalformedHeader,
    ChunkFraming,
    AlreadySent,
    BodyAlreadyTaken,
    ConnectionNotReusable,
    TlsBuffersInUse
};

struct HttpErrorInfo {
    HttpError error;
    std::string message;
    TransportError transport = TransportError::ReadError; // meaningful for Network/Dns/Tls
    bool connection_poisoned = false;

    // True when no request byte reached the wire, so the request may be retried
    // on a fresh connection.
    bool retry_safe() const { return !connection_poisoned; }
};

std::string_view to_string(HttpError error);

// Errors raised before anything was written.
inline HttpErrorInfo setup_error(HttpError error, std::string message) {
    return HttpErrorInfo{error, std::move(message), TransportError::ConnectionFailed, false};
}

// Errors raised while writing a request or reading a response.
inline HttpErrorInfo wire_error(HttpError error, std::string message) {
    return HttpErrorInfo{error, std::move(message), TransportError::ReadError, true};
}

inline HttpErrorInfo network_error(TransportErrorInfo info) {
    return HttpErrorInfo{HttpError::Network, std::move(info.message), info.error, true};
}

} // namespace reqlite
