#include "http_error.hpp"

namespace reqlite {

std::string_view to_string(HttpError error) {
    switch (error) {
        case HttpError::Network: return "network error";
        case HttpError::Dns: return "dns resolution failed";
        case HttpError::Tls: return "tls error";
        case HttpError::InvalidUrl: return "invalid url";
        case HttpError::UnsupportedScheme: return "unsupported scheme";
        case HttpError::BufferTooSmall: return "buffer too small";
        case HttpError::MalformedStatus: return "malformed status line";
        case HttpError::MalformedHeader: return "malformed header";
        case HttpError::ChunkFraming: return "invalid chunked framing";
        case HttpError::AlreadySent: return "request already sent";
        case HttpError::BodyAlreadyTaken: return "response body already taken";
        case HttpError::ConnectionNotReusable: return "connection not reusable";
        case HttpError::TlsBuffersInUse: return "TLS buffers in use";
    }
    return "unknown";
}

} // namespace reqlite
