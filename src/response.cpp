#include "response.hpp"
#include "compact_log.hpp"
#include <algorithm>
#include <charconv>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

namespace reqlite {

namespace {

constexpr std::string_view kHeaderEnd = "\r\n\r\n";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

HttpErrorInfo eof_error(std::string message) {
    auto err = wire_error(HttpError::Network, std::move(message));
    err.transport = TransportError::UnexpectedEof;
    return err;
}

// "HTTP/1.1 200 OK"
std::expected<std::pair<StatusCode, std::string_view>, HttpErrorInfo> parse_status_line(std::string_view line) {
    if (!line.starts_with("HTTP/")) {
        return std::unexpected(wire_error(HttpError::MalformedStatus, "Status line does not start with HTTP/"));
    }
    auto space = line.find(' ');
    if (space == std::string_view::npos) {
        return std::unexpected(wire_error(HttpError::MalformedStatus, "Status line has no status code"));
    }
    auto rest = line.substr(space + 1);
    if (rest.size() < 3 || (rest.size() > 3 && rest[3] != ' ')) {
        return std::unexpected(wire_error(HttpError::MalformedStatus, "Status code is not three digits"));
    }
    uint16_t code = 0;
    for (int i = 0; i < 3; ++i) {
        if (rest[i] < '0' || rest[i] > '9') {
            return std::unexpected(wire_error(HttpError::MalformedStatus, "Status code is not three digits"));
        }
        code = static_cast<uint16_t>(code * 10 + (rest[i] - '0'));
    }
    auto reason = rest.size() > 3 ? rest.substr(4) : std::string_view{};
    return std::pair{StatusCode{code}, reason};
}

std::expected<void, HttpErrorInfo> validate_headers(std::string_view block) {
    while (!block.empty()) {
        auto eol = block.find("\r\n");
        auto line = block.substr(0, eol);
        block = eol == std::string_view::npos ? std::string_view{} : block.substr(eol + 2);

        if (line.empty() || line.front() == ' ' || line.front() == '\t') {
            return std::unexpected(wire_error(HttpError::MalformedHeader, "Folded or empty header line"));
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::unexpected(wire_error(HttpError::MalformedHeader, "Header line without name"));
        }
        if (line.substr(0, colon).find_first_of(" \t") != std::string_view::npos) {
            return std::unexpected(wire_error(HttpError::MalformedHeader, "Whitespace in header name"));
        }
    }
    return {};
}

std::optional<size_t> parse_length(std::string_view value) {
    value = trim(value);
    size_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) return std::nullopt;
    return length;
}

} // namespace

std::string_view to_string(BodyFraming framing) {
    switch (framing) {
        case BodyFraming::Fixed: return "fixed";
        case BodyFraming::Chunked: return "chunked";
        case BodyFraming::ToClose: return "to-close";
    }
    return "?";
}

std::expected<size_t, TransportErrorInfo> BodyReader::Source::read(std::span<char> out) {
    if (pos_ < len_) {
        size_t n = std::min(out.size(), len_ - pos_);
        std::memmove(out.data(), buffer_.data() + pos_, n);
        pos_ += n;
        return n;
    }
    return conn_->read(out);
}

std::expected<int, TransportErrorInfo> BodyReader::Source::read_byte() {
    if (pos_ == len_) {
        auto region = buffer_.subspan(std::min(floor_, buffer_.size()));
        if (region.empty()) {
            char c;
            auto received = conn_->read(std::span<char>(&c, 1));
            if (!received) return std::unexpected(std::move(received.error()));
            if (*received == 0) return -1;
            return static_cast<unsigned char>(c);
        }
        auto received = conn_->read(region);
        if (!received) return std::unexpected(std::move(received.error()));
        if (*received == 0) return -1;
        pos_ = floor_;
        len_ = floor_ + *received;
    }
    return static_cast<unsigned char>(buffer_[pos_++]);
}

void BodyReader::Source::compact() {
    if (pos_ > 0) {
        std::memmove(buffer_.data(), buffer_.data() + pos_, len_ - pos_);
        len_ -= pos_;
        pos_ = 0;
    }
    floor_ = 0;
}

BodyReader::BodyReader(Connection& conn, std::span<char> buffer, size_t staged, BodyFraming framing, size_t length)
    : source_(conn, buffer, staged), framing_(framing), remaining_(length) {
    if (framing_ == BodyFraming::Fixed && remaining_ == 0) done_ = true;
}

std::expected<size_t, HttpErrorInfo> BodyReader::read(std::span<char> buffer) {
    if (failure_) return std::unexpected(*failure_);
    if (done_ || buffer.empty()) return 0;

    switch (framing_) {
        case BodyFraming::Fixed: return read_fixed(buffer);
        case BodyFraming::Chunked: return read_chunked(buffer);
        case BodyFraming::ToClose: return read_to_close(buffer);
    }
    return 0;
}

std::expected<std::span<char>, HttpErrorInfo> BodyReader::read_to_end() {
    if (failure_) return std::unexpected(*failure_);

    auto buffer = source_.buffer();
    source_.compact();
    size_t out = 0;
    while (!done_) {
        source_.set_floor(out);
        auto dst = buffer.subspan(out);
        if (dst.empty()) {
            // The body may be complete with only its terminator left to see.
            char extra;
            auto n = read(std::span<char>(&extra, 1));
            if (!n) return std::unexpected(std::move(n.error()));
            if (*n == 0) break;
            return fail(wire_error(HttpError::BufferTooSmall, "Response body does not fit in the receive buffer"));
        }
        auto n = read(dst);
        if (!n) return std::unexpected(std::move(n.error()));
        if (*n == 0) break;
        out += *n;
    }
    return buffer.first(out);
}

std::expected<size_t, HttpErrorInfo> BodyReader::discard() {
    char scratch[256];
    size_t total = 0;
    while (true) {
        auto n = read(scratch);
        if (!n) return std::unexpected(std::move(n.error()));
        if (*n == 0) return total;
        total += *n;
    }
}

std::expected<size_t, HttpErrorInfo> BodyReader::read_fixed(std::span<char> buffer) {
    size_t want = std::min(buffer.size(), remaining_);
    auto n = source_.read(buffer.first(want));
    if (!n) return fail(network_error(std::move(n.error())));
    if (*n == 0) {
        return fail(eof_error("Connection closed with " + std::to_string(remaining_) + " body bytes outstanding"));
    }
    remaining_ -= *n;
    if (remaining_ == 0) finish(ConnectionState::Idle);
    return *n;
}

std::expected<size_t, HttpErrorInfo> BodyReader::read_chunked(std::span<char> buffer) {
    while (true) {
        switch (chunk_) {
            case ChunkState::ReadSize: {
                auto size = read_chunk_size();
                if (!size) return std::unexpected(std::move(size.error()));
                if (*size == 0) {
                    chunk_ = ChunkState::ReadTrailers;
                } else {
                    remaining_ = *size;
                    chunk_ = ChunkState::ReadData;
                }
                break;
            }
            case ChunkState::ReadData: {
                size_t want = std::min(buffer.size(), remaining_);
                auto n = source_.read(buffer.first(want));
                if (!n) return fail(network_error(std::move(n.error())));
                if (*n == 0) return fail(eof_error("Connection closed inside a chunk"));
                remaining_ -= *n;
                if (remaining_ == 0) chunk_ = ChunkState::ReadDataCrlf;
                return *n;
            }
            case ChunkState::ReadDataCrlf: {
                if (auto crlf = expect_crlf(); !crlf) return std::unexpected(std::move(crlf.error()));
                chunk_ = ChunkState::ReadSize;
                break;
            }
            case ChunkState::ReadTrailers: {
                if (auto trailers = skip_trailers(); !trailers) return std::unexpected(std::move(trailers.error()));
                chunk_ = ChunkState::Done;
                finish(ConnectionState::Idle);
                return 0;
            }
            case ChunkState::Done:
                return 0;
        }
    }
}

std::expected<size_t, HttpErrorInfo> BodyReader::read_to_close(std::span<char> buffer) {
    auto n = source_.read(buffer);
    if (!n) return fail(network_error(std::move(n.error())));
    if (*n == 0) finish(ConnectionState::Closed);
    return *n;
}

std::expected<char, HttpErrorInfo> BodyReader::next_byte() {
    auto c = source_.read_byte();
    if (!c) return fail(network_error(std::move(c.error())));
    if (*c < 0) return fail(eof_error("Connection closed inside chunked framing"));
    return static_cast<char>(*c);
}

// chunk-size [ ";" extensions ] CRLF
std::expected<size_t, HttpErrorInfo> BodyReader::read_chunk_size() {
    size_t size = 0;
    int digits = 0;
    bool in_extension = false;
    bool trailing_space = false;

    while (true) {
        auto c = next_byte();
        if (!c) return std::unexpected(std::move(c.error()));

        if (*c == '\r') {
            auto lf = next_byte();
            if (!lf) return std::unexpected(std::move(lf.error()));
            if (*lf != '\n') return fail(wire_error(HttpError::ChunkFraming, "Chunk size line not terminated by CRLF"));
            break;
        }
        if (in_extension) continue;
        if (*c == ';' && digits > 0) {
            in_extension = true;
            continue;
        }
        if ((*c == ' ' || *c == '\t') && digits > 0) {
            trailing_space = true;
            continue;
        }

        int value = hex_value(*c);
        if (value < 0 || trailing_space) {
            return fail(wire_error(HttpError::ChunkFraming, "Invalid character in chunk size"));
        }
        if (size > (std::numeric_limits<size_t>::max() >> 4)) {
            return fail(wire_error(HttpError::ChunkFraming, "Chunk size overflows"));
        }
        size = (size << 4) | static_cast<size_t>(value);
        ++digits;
    }

    if (digits == 0) return fail(wire_error(HttpError::ChunkFraming, "Empty chunk size"));
    log::trace("body: chunk of ", size, " bytes");
    return size;
}

std::expected<void, HttpErrorInfo> BodyReader::expect_crlf() {
    for (char want : {'\r', '\n'}) {
        auto c = next_byte();
        if (!c) return std::unexpected(std::move(c.error()));
        if (*c != want) return fail(wire_error(HttpError::ChunkFraming, "Chunk data not followed by CRLF"));
    }
    return {};
}

// Trailer fields are read and dropped up to the blank line.
std::expected<void, HttpErrorInfo> BodyReader::skip_trailers() {
    size_t line_length = 0;
    while (true) {
        auto c = next_byte();
        if (!c) return std::unexpected(std::move(c.error()));
        if (*c != '\r') {
            ++line_length;
            continue;
        }
        auto lf = next_byte();
        if (!lf) return std::unexpected(std::move(lf.error()));
        if (*lf != '\n') return fail(wire_error(HttpError::ChunkFraming, "Trailer line not terminated by CRLF"));
        if (line_length == 0) return {};
        line_length = 0;
    }
}

void BodyReader::finish(ConnectionState state) {
    done_ = true;
    source_.connection().set_state(state);
}

std::unexpected<HttpErrorInfo> BodyReader::fail(HttpErrorInfo error) {
    log::debug("body: ", to_string(framing_), " read failed: ", error.message);
    done_ = true;
    source_.connection().set_state(ConnectionState::Poisoned);
    failure_ = error;
    return std::unexpected(std::move(error));
}

Response::Response(Response&& other) noexcept
    : conn_(other.conn_),
      method_(other.method_),
      status_(other.status_),
      reason_(other.reason_),
      headers_(other.headers_),
      body_buf_(other.body_buf_),
      staged_(other.staged_),
      framing_(other.framing_),
      length_(other.length_),
      content_length_(other.content_length_),
      body_taken_(std::exchange(other.body_taken_, true)) {}

Response& Response::operator=(Response&& other) noexcept {
    if (this != &other) {
        conn_ = other.conn_;
        method_ = other.method_;
        status_ = other.status_;
        reason_ = other.reason_;
        headers_ = other.headers_;
        body_buf_ = other.body_buf_;
        staged_ = other.staged_;
        framing_ = other.framing_;
        length_ = other.length_;
        content_length_ = other.content_length_;
        body_taken_ = std::exchange(other.body_taken_, true);
    }
    return *this;
}

std::expected<Response, HttpErrorInfo> Response::read(Connection& conn, Method method, std::span<char> rx_buf) {
    // A closed or failed stream has no response to offer; leave its state alone.
    if (auto reusable = conn.ensure_reusable(); !reusable) return std::unexpected(std::move(reusable.error()));

    auto poison = [&](HttpErrorInfo err) {
        conn.set_state(ConnectionState::Poisoned);
        log::debug("response: ", err.message);
        return std::unexpected(std::move(err));
    };

    size_t filled = 0;
    size_t status_end = std::string_view::npos;
    size_t header_end = std::string_view::npos;
    Response response;

    while (true) {
        std::string_view view(rx_buf.data(), filled);

        if (status_end == std::string_view::npos) {
            status_end = view.find("\r\n");
            if (status_end != std::string_view::npos) {
                auto status = parse_status_line(view.substr(0, status_end));
                if (!status) return poison(std::move(status.error()));
                response.status_ = status->first;
                response.reason_ = status->second;
            }
        }
        if (status_end != std::string_view::npos) {
            header_end = view.find(kHeaderEnd, status_end);
            if (header_end != std::string_view::npos) break;
        }

        if (filled == rx_buf.size()) {
            return poison(wire_error(HttpError::BufferTooSmall,
                status_end == std::string_view::npos ? "Status line does not fit in the receive buffer"
                                                     : "Response headers do not fit in the receive buffer"));
        }

        auto n = conn.read(rx_buf.subspan(filled));
        if (!n) return poison(network_error(std::move(n.error())));
        if (*n == 0) return poison(eof_error("Connection closed before the response header block ended"));
        filled += *n;
    }

    size_t block_start = status_end + 2;
    size_t block_end = header_end + 2;
    std::string_view block(rx_buf.data() + block_start, block_end - block_start);
    if (auto valid = validate_headers(block); !valid) return poison(std::move(valid.error()));

    size_t body_start = header_end + kHeaderEnd.size();
    response.conn_ = &conn;
    response.method_ = method;
    response.headers_ = HeaderBlock(block);
    response.body_buf_ = rx_buf.subspan(body_start);
    response.staged_ = filled - body_start;

    if (auto cl = response.headers_.find("Content-Length")) response.content_length_ = parse_length(*cl);
    auto te = response.headers_.find("Transfer-Encoding");

    if (method == Method::Head || !response.status_.has_body()) {
        response.framing_ = BodyFraming::Fixed;
        response.length_ = 0;
    } else if (te && contains_token(*te, "chunked")) {
        response.framing_ = BodyFraming::Chunked;
    } else if (response.content_length_) {
        response.framing_ = BodyFraming::Fixed;
        response.length_ = *response.content_length_;
    } else {
        response.framing_ = BodyFraming::ToClose;
    }

    bool empty_body = response.framing_ == BodyFraming::Fixed && response.length_ == 0;
    conn.set_state(empty_body ? ConnectionState::Idle : ConnectionState::InBody);

    if (response.framing_ == BodyFraming::Fixed) {
        log::debug("response: ", response.status_.code, " fixed body of ", response.length_, " bytes");
    } else {
        log::debug("response: ", response.status_.code, " ", to_string(response.framing_), " body");
    }
    return response;
}

std::optional<ContentType> Response::content_type() const {
    if (auto value = headers_.find("Content-Type")) return content_type_from_str(*value);
    return std::nullopt;
}

bool Response::connection_close() const {
    auto value = headers_.find("Connection");
    return value && contains_token(*value, "close");
}

std::expected<BodyReader, HttpErrorInfo> Response::body() {
    if (body_taken_ || !conn_) {
        return std::unexpected(setup_error(HttpError::BodyAlreadyTaken, "Response body reader already handed out"));
    }
    body_taken_ = true;
    return BodyReader(*conn_, body_buf_, staged_, framing_, length_);
}

} // namespace reqlite
