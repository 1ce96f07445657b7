#pragma once

#include "connection.hpp"
#include "headers.hpp"
#include <optional>
#include <span>

namespace reqlite {

enum class BodyFraming { Fixed, Chunked, ToClose };

std::string_view to_string(BodyFraming framing);

// Lazy, single-pass reader over a response body. Borrows the connection and the
// part of rx_buf behind the header block; both must outlive it. Once the body
// is complete every read() returns 0 without touching the connection.
class BodyReader {
public:
    BodyReader(BodyReader&&) noexcept = default;
    BodyReader& operator=(BodyReader&&) noexcept = default;
    BodyReader(const BodyReader&) = delete;
    BodyReader& operator=(const BodyReader&) = delete;

    // Returns up to buffer.size() body bytes, 0 at end of body.
    std::expected<size_t, HttpErrorInfo> read(std::span<char> buffer);

    // Reads the rest of the body into the free part of rx_buf and returns it.
    std::expected<std::span<char>, HttpErrorInfo> read_to_end();

    // Drains the rest of the body so the connection can carry another request.
    std::expected<size_t, HttpErrorInfo> discard();

    bool is_done() const { return done_; }
    BodyFraming framing() const { return framing_; }

private:
    friend class Response;

    enum class ChunkState { ReadSize, ReadData, ReadDataCrlf, ReadTrailers, Done };

    // Bytes already pulled into rx_buf are served first, then the connection.
    class Source {
    public:
        Source(Connection& conn, std::span<char> buffer, size_t staged)
            : conn_(&conn), buffer_(buffer), len_(staged) {}

        std::expected<size_t, TransportErrorInfo> read(std::span<char> out);
        // -1 at end of stream.
        std::expected<int, TransportErrorInfo> read_byte();

        // Refills land at or after floor.
        void set_floor(size_t floor) { floor_ = floor; }
        void compact();

        std::span<char> buffer() const { return buffer_; }
        Connection& connection() { return *conn_; }

    private:
        Connection* conn_;
        std::span<char> buffer_;
        size_t floor_ = 0;
        size_t pos_ = 0;
        size_t len_ = 0;
    };

    BodyReader(Connection& conn, std::span<char> buffer, size_t staged, BodyFraming framing, size_t length);

    std::expected<size_t, HttpErrorInfo> read_fixed(std::span<char> buffer);
    std::expected<size_t, HttpErrorInfo> read_chunked(std::span<char> buffer);
    std::expected<size_t, HttpErrorInfo> read_to_close(std::span<char> buffer);

    std::expected<char, HttpErrorInfo> next_byte();
    std::expected<size_t, HttpErrorInfo> read_chunk_size();
    std::expected<void, HttpErrorInfo> expect_crlf();
    std::expected<void, HttpErrorInfo> skip_trailers();

    void finish(ConnectionState state);
    std::unexpected<HttpErrorInfo> fail(HttpErrorInfo error);

    Source source_;
    BodyFraming framing_;
    size_t remaining_;
    ChunkState chunk_ = ChunkState::ReadSize;
    bool done_ = false;
    std::optional<HttpErrorInfo> failure_;
};

// Status line and headers parsed in place inside rx_buf.
class Response {
public:
    // Reads until the header block is complete. rx_buf must hold the status
    // line and all headers; bytes read past them start the body.
    static std::expected<Response, HttpErrorInfo> read(Connection& conn, Method method, std::span<char> rx_buf);

    Response(Response&& other) noexcept;
    Response& operator=(Response&& other) noexcept;
    Response(const Response&) = delete;
    Response& operator=(const Response&) = delete;

    StatusCode status() const { return status_; }
    std::string_view reason() const { return reason_; }
    const HeaderBlock& headers() const { return headers_; }
    std::optional<std::string_view> header(std::string_view name) const { return headers_.find(name); }

    std::optional<size_t> content_length() const { return content_length_; }
    std::optional<ContentType> content_type() const;
    bool is_chunked() const { return framing_ == BodyFraming::Chunked; }
    bool connection_close() const;
    BodyFraming framing() const { return framing_; }
    Method request_method() const { return method_; }

    // The single reader for this response's body.
    std::expected<BodyReader, HttpErrorInfo> body();

private:
    Response() = default;

    Connection* conn_ = nullptr;
    Method method_ = Method::Get;
    StatusCode status_;
    std::string_view reason_;
    HeaderBlock headers_;
    std::span<char> body_buf_;
    size_t staged_ = 0;
    BodyFraming framing_ = BodyFraming::Fixed;
    size_t length_ = 0;
    std::optional<size_t> content_length_;
    bool body_taken_ = false;
};

} // namespace reqlite
