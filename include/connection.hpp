#pragma once

#include "buffered_write.hpp"
#include "http_error.hpp"
#include "tls_session.hpp"
#include <memory>
#include <variant>

namespace reqlite {

struct Request;
class Response;
class BodyReader;

enum class ConnectionKind { Plain, PlainBuffered, Tls };

std::string_view to_string(ConnectionKind kind);

// Where the connection stands between request/response cycles.
enum class ConnectionState {
    Idle,     // ready for the next request
    InBody,   // a response body has not been read to its end yet
    Closed,   // a read-to-close body consumed the stream
    Poisoned  // an error left the framing position undefined
};

// Raw transport, forwarded as is.
class PlainStream {
public:
    explicit PlainStream(std::unique_ptr<Transport> transport) : transport_(std::move(transport)) {}

    std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) { return transport_->read(buffer); }
    std::expected<size_t, TransportErrorInfo> write(std::span<const char> data) { return transport_->write(data); }
    std::expected<void, TransportErrorInfo> flush() { return transport_->flush(); }
    void close() { transport_->close(); }

    std::unique_ptr<Transport> release() { return std::move(transport_); }

private:
    std::unique_ptr<Transport> transport_;
};

// Marks a client's scratch buffers as lent to one connection. Released when
// the holding connection closes or is destroyed.
class BufferLease {
public:
    BufferLease() = default;
    explicit BufferLease(std::shared_ptr<bool> held) : held_(std::move(held)) { *held_ = true; }
    ~BufferLease() { release(); }

    BufferLease(BufferLease&& other) noexcept : held_(std::move(other.held_)) {}
    BufferLease& operator=(BufferLease&& other) noexcept {
        if (this != &other) {
            release();
            held_ = std::move(other.held_);
        }
        return *this;
    }
    BufferLease(const BufferLease&) = delete;
    BufferLease& operator=(const BufferLease&) = delete;

    void release() {
        if (held_) {
            *held_ = false;
            held_.reset();
        }
    }

private:
    std::shared_ptr<bool> held_;
};

// Owns exactly one transport in one of three forms. Moved, never shared, between
// the client, request handles and resource scopes.
class Connection {
public:
#ifdef REQLITE_ENABLE_TLS
    using Stream = std::variant<PlainStream, BufferedWrite, TlsSession>;
#else
    using Stream = std::variant<PlainStream, BufferedWrite>;
#endif

    static Connection plain(std::unique_ptr<Transport> transport);
    static Connection buffered(std::unique_ptr<Transport> transport, std::span<char> tx_buf);
#ifdef REQLITE_ENABLE_TLS
    static Connection tls(TlsSession session);
#endif

    Connection(Connection&&) noexcept = default;
    Connection& operator=(Connection&&) noexcept = default;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Plain becomes PlainBuffered over tx_buf; the other forms already buffer
    // and pass through unchanged. tx_buf must outlive the connection.
    Connection into_buffered(std::span<char> tx_buf) &&;

    ConnectionKind kind() const;
    ConnectionState state() const { return state_; }

    std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer);
    std::expected<size_t, TransportErrorInfo> write(std::span<const char> data);
    std::expected<void, TransportErrorInfo> flush();
    void close();

    // Writes the request as is (no base path) and reads the response head into rx_buf.
    std::expected<Response, HttpErrorInfo> send(const Request& request, std::span<char> rx_buf);

    // Fails unless the previous exchange left the stream at a message boundary.
    std::expected<void, HttpErrorInfo> ensure_reusable() const;

private:
    friend struct Request;
    friend class Response;
    friend class BodyReader;
    friend class HttpClient;

    explicit Connection(Stream stream) : stream_(std::move(stream)) {}

    void set_state(ConnectionState state) { state_ = state; }
    void hold(BufferLease lease) { lease_ = std::move(lease); }

    Stream stream_;
    ConnectionState state_ = ConnectionState::Idle;
    BufferLease lease_;
};

} // namespace reqlite
