#pragma once

#include "connection.hpp"
#include "headers.hpp"
#include <optional>
#include <span>
#include <string_view>

namespace reqlite {

// Sink a RequestBody streams itself into. The serializer supplies one that
// applies the body's framing.
class BodyWriter {
public:
    virtual ~BodyWriter() = default;
    virtual std::expected<void, TransportErrorInfo> write(std::span<const char> data) = 0;

    std::expected<void, TransportErrorInfo> write(std::string_view text) {
        return write(std::span<const char>(text.data(), text.size()));
    }
};

class RequestBody {
public:
    virtual ~RequestBody() = default;

    // A known size is sent with Content-Length; std::nullopt selects chunked
    // transfer coding.
    virtual std::optional<size_t> size() const = 0;
    virtual std::expected<void, TransportErrorInfo> write(BodyWriter& out) const = 0;
};

// Fixed-length body over borrowed bytes.
class BytesBody : public RequestBody {
public:
    explicit BytesBody(std::span<const char> data) : data_(data) {}
    explicit BytesBody(std::string_view text) : data_(text.data(), text.size()) {}
    explicit BytesBody(std::span<const uint8_t> data)
        : data_(reinterpret_cast<const char*>(data.data()), data.size()) {}

    std::optional<size_t> size() const override { return data_.size(); }
    std::expected<void, TransportErrorInfo> write(BodyWriter& out) const override { return out.write(data_); }

private:
    std::span<const char> data_;
};

// Chunked body; each non-empty fragment goes out as one chunk.
class ChunkedBody : public RequestBody {
public:
    explicit ChunkedBody(std::span<const std::string_view> fragments) : fragments_(fragments) {}

    std::optional<size_t> size() const override { return std::nullopt; }
    std::expected<void, TransportErrorInfo> write(BodyWriter& out) const override;

private:
    std::span<const std::string_view> fragments_;
};

struct BasicAuth {
    std::string_view username;
    std::string_view password;
};

// Every view (path, host, headers, body) is borrowed and must outlive write().
struct Request {
    Method method = Method::Get;
    std::string_view path = "/";
    std::optional<std::string_view> host;
    std::optional<std::string_view> base_path;
    std::span<const Header> headers;
    std::optional<ContentType> content_type;
    std::optional<BasicAuth> basic_auth;
    const RequestBody* body = nullptr;

    // Renders the request line, headers and body onto conn, then flushes.
    std::expected<void, HttpErrorInfo> write(Connection& conn) const;
};

class RequestBuilder {
public:
    RequestBuilder(Method method, std::string_view path);

    RequestBuilder& headers(std::span<const Header> headers);
    RequestBuilder& path(std::string_view path);
    RequestBuilder& host(std::string_view host);
    RequestBuilder& content_type(ContentType content_type);
    RequestBuilder& basic_auth(std::string_view username, std::string_view password);
    RequestBuilder& body(const RequestBody& body);

    Request build() const { return request_; }

private:
    Request request_;
};

} // namespace reqlite
