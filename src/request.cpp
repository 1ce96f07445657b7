#include "request.hpp"
#include "compact_log.hpp"
#include <openssl/evp.h>
#include <charconv>
#include <string>

namespace reqlite {

namespace {

constexpr std::string_view kCrlf = "\r\n";

// Sticky-error writer: after the first failure every put() is a no-op.
class WireWriter {
public:
    explicit WireWriter(Connection& conn) : conn_(conn) {}

    void put(std::string_view text) {
        if (error_ || text.empty()) return;
        if (auto written = write_all(conn_, text); !written) error_ = std::move(written.error());
    }

    void put_bytes(std::span<const char> data) { put(std::string_view(data.data(), data.size())); }

    void put_number(size_t value, int base = 10) {
        char buf[24];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, base);
        put(std::string_view(buf, ptr - buf));
    }

    void header(std::string_view name, std::string_view value) {
        put(name);
        put(": ");
        put(value);
        put(kCrlf);
    }

    void fail(TransportErrorInfo info) {
        if (!error_) error_ = std::move(info);
    }

    const std::optional<TransportErrorInfo>& error() const { return error_; }

    std::expected<void, TransportErrorInfo> status() const {
        if (error_) return std::unexpected(*error_);
        return {};
    }

private:
    Connection& conn_;
    std::optional<TransportErrorInfo> error_;
};

class FixedBodyWriter : public BodyWriter {
public:
    explicit FixedBodyWriter(WireWriter& wire) : wire_(wire) {}

    using BodyWriter::write;
    std::expected<void, TransportErrorInfo> write(std::span<const char> data) override {
        wire_.put_bytes(data);
        written_ += data.size();
        return wire_.status();
    }

    size_t written() const { return written_; }

private:
    WireWriter& wire_;
    size_t written_ = 0;
};

class ChunkedBodyWriter : public BodyWriter {
public:
    explicit ChunkedBodyWriter(WireWriter& wire) : wire_(wire) {}

    using BodyWriter::write;
    // An empty fragment would read as the terminating chunk, so it is dropped.
    std::expected<void, TransportErrorInfo> write(std::span<const char> data) override {
        if (data.empty()) return wire_.status();
        wire_.put_number(data.size(), 16);
        wire_.put(kCrlf);
        wire_.put_bytes(data);
        wire_.put(kCrlf);
        return wire_.status();
    }

    void finish() { wire_.put("0\r\n\r\n"); }

private:
    WireWriter& wire_;
};

// base64(username ":" password) in 48-byte groups so no temporary string is needed.
void put_basic_auth(WireWriter& wire, const BasicAuth& auth) {
    unsigned char in[48];
    unsigned char out[65];
    int n = 0;

    auto emit = [&] {
        int len = EVP_EncodeBlock(out, in, n);
        wire.put(std::string_view(reinterpret_cast<const char*>(out), static_cast<size_t>(len)));
        n = 0;
    };
    auto feed = [&](std::string_view s) {
        for (char c : s) {
            in[n++] = static_cast<unsigned char>(c);
            if (n == static_cast<int>(sizeof(in))) emit();
        }
    };

    wire.put("Authorization: Basic ");
    feed(auth.username);
    feed(":");
    feed(auth.password);
    if (n > 0) emit();
    wire.put(kCrlf);
}

// base_path and path are joined with exactly one '/'.
void put_path(WireWriter& wire, std::optional<std::string_view> base_path, std::string_view path) {
    if (!base_path || base_path->empty()) {
        wire.put(path.empty() ? std::string_view("/") : path);
        return;
    }

    std::string_view base = *base_path;
    wire.put(base);
    if (path.empty()) return;

    bool base_slash = base.back() == '/';
    bool path_slash = path.front() == '/';
    if (base_slash && path_slash) {
        path.remove_prefix(1);
    } else if (!base_slash && !path_slash) {
        wire.put("/");
    }
    wire.put(path);
}

} // namespace

std::expected<void, TransportErrorInfo> ChunkedBody::write(BodyWriter& out) const {
    for (auto fragment : fragments_) {
        if (auto written = out.write(fragment); !written) return written;
    }
    return {};
}

std::expected<void, HttpErrorInfo> Request::write(Connection& conn) const {
    if (auto reusable = conn.ensure_reusable(); !reusable) return reusable;

    WireWriter wire(conn);
    wire.put(to_string(method));
    wire.put(" ");
    put_path(wire, base_path, path);
    wire.put(" HTTP/1.1\r\n");

    if (host) wire.header("Host", *host);
    for (const auto& h : headers) wire.header(h.name, h.value);
    if (content_type) wire.header("Content-Type", to_string(*content_type));
    if (basic_auth) put_basic_auth(wire, *basic_auth);

    std::optional<size_t> length;
    if (body) {
        length = body->size();
        if (length) {
            wire.put("Content-Length: ");
            wire.put_number(*length);
            wire.put(kCrlf);
        } else {
            wire.header("Transfer-Encoding", "chunked");
        }
    }
    wire.put(kCrlf);

    if (body && !wire.error()) {
        if (length) {
            FixedBodyWriter writer(wire);
            if (auto streamed = body->write(writer); !streamed) {
                wire.fail(std::move(streamed.error()));
            } else if (writer.written() != *length) {
                std::string msg = "Body wrote ";
                msg += std::to_string(writer.written());
                msg += " bytes but declared ";
                msg += std::to_string(*length);
                wire.fail(TransportErrorInfo{TransportError::WriteError, msg});
            }
        } else {
            ChunkedBodyWriter writer(wire);
            if (auto streamed = body->write(writer); !streamed) {
                wire.fail(std::move(streamed.error()));
            } else {
                writer.finish();
            }
        }
    }

    if (!wire.error()) {
        if (auto flushed = conn.flush(); !flushed) wire.fail(std::move(flushed.error()));
    }

    if (wire.error()) {
        conn.set_state(ConnectionState::Poisoned);
        log::debug("request: ", to_string(method), " ", path, " failed: ", wire.error()->message);
        return std::unexpected(network_error(*wire.error()));
    }

    log::trace("request: ", to_string(method), " ", path, " written");
    return {};
}

RequestBuilder::RequestBuilder(Method method, std::string_view path) {
    request_.method = method;
    request_.path = path;
}

RequestBuilder& RequestBuilder::headers(std::span<const Header> headers) {
    request_.headers = headers;
    return *this;
}

RequestBuilder& RequestBuilder::path(std::string_view path) {
    request_.path = path;
    return *this;
}

RequestBuilder& RequestBuilder::host(std::string_view host) {
    request_.host = host;
    return *this;
}

RequestBuilder& RequestBuilder::content_type(ContentType content_type) {
    request_.content_type = content_type;
    return *this;
}

RequestBuilder& RequestBuilder::basic_auth(std::string_view username, std::string_view password) {
    request_.basic_auth = BasicAuth{username, password};
    return *this;
}

RequestBuilder& RequestBuilder::body(const RequestBody& body) {
    request_.body = &body;
    return *this;
}

} // namespace reqlite
