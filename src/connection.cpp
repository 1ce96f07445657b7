#include "connection.hpp"
#include "request.hpp"
#include "response.hpp"
#include "compact_log.hpp"

namespace reqlite {

std::string_view to_string(ConnectionKind kind) {
    switch (kind) {
        case ConnectionKind::Plain: return "Plain";
        case ConnectionKind::PlainBuffered: return "PlainBuffered";
        case ConnectionKind::Tls: return "Tls";
    }
    return "?";
}

Connection Connection::plain(std::unique_ptr<Transport> transport) {
    return Connection(Stream(std::in_place_type<PlainStream>, std::move(transport)));
}

Connection Connection::buffered(std::unique_ptr<Transport> transport, std::span<char> tx_buf) {
    return Connection(Stream(std::in_place_type<BufferedWrite>, std::move(transport), tx_buf));
}

#ifdef REQLITE_ENABLE_TLS
Connection Connection::tls(TlsSession session) {
    return Connection(Stream(std::in_place_type<TlsSession>, std::move(session)));
}
#endif

Connection Connection::into_buffered(std::span<char> tx_buf) && {
    if (auto* plain = std::get_if<PlainStream>(&stream_)) {
        Connection converted = buffered(plain->release(), tx_buf);
        converted.state_ = state_;
        converted.lease_ = std::move(lease_);
        return converted;
    }
    return std::move(*this);
}

ConnectionKind Connection::kind() const {
    switch (stream_.index()) {
        case 0: return ConnectionKind::Plain;
        case 1: return ConnectionKind::PlainBuffered;
        default: return ConnectionKind::Tls;
    }
}

std::expected<size_t, TransportErrorInfo> Connection::read(std::span<char> buffer) {
    return std::visit([&](auto& stream) { return stream.read(buffer); }, stream_);
}

std::expected<size_t, TransportErrorInfo> Connection::write(std::span<const char> data) {
    return std::visit([&](auto& stream) { return stream.write(data); }, stream_);
}

std::expected<void, TransportErrorInfo> Connection::flush() {
    return std::visit([](auto& stream) { return stream.flush(); }, stream_);
}

void Connection::close() {
    std::visit([](auto& stream) { stream.close(); }, stream_);
    state_ = ConnectionState::Closed;
    lease_.release();
}

std::expected<void, HttpErrorInfo> Connection::ensure_reusable() const {
    switch (state_) {
        case ConnectionState::Idle:
            return {};
        case ConnectionState::InBody:
            return std::unexpected(setup_error(HttpError::ConnectionNotReusable,
                "Previous response body was not read to its end"));
        case ConnectionState::Closed:
            return std::unexpected(setup_error(HttpError::ConnectionNotReusable,
                "Connection was closed"));
        case ConnectionState::Poisoned:
            return std::unexpected(setup_error(HttpError::ConnectionNotReusable,
                "Connection failed during a previous exchange"));
    }
    return {};
}

std::expected<Response, HttpErrorInfo> Connection::send(const Request& request, std::span<char> rx_buf) {
    if (auto written = request.write(*this); !written) return std::unexpected(std::move(written.error()));
    return Response::read(*this, request.method, rx_buf);
}

} // namespace reqlite
