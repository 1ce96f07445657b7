#pragma once

#include "connection.hpp"
#include "request.hpp"
#include "response.hpp"
#include "url.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace reqlite {

// Single-use request bound to its own connection. Pre-populated with the
// method, the URL's path and host. The handle must stay in place (not moved)
// while a Response obtained from it is alive.
class HttpRequestHandle {
public:
    HttpRequestHandle(HttpRequestHandle&&) noexcept = default;
    HttpRequestHandle& operator=(HttpRequestHandle&&) noexcept = default;
    HttpRequestHandle(const HttpRequestHandle&) = delete;
    HttpRequestHandle& operator=(const HttpRequestHandle&) = delete;

    HttpRequestHandle& headers(std::span<const Header> headers);
    HttpRequestHandle& path(std::string_view path);
    HttpRequestHandle& host(std::string_view host);
    HttpRequestHandle& content_type(ContentType content_type);
    HttpRequestHandle& basic_auth(std::string_view username, std::string_view password);
    HttpRequestHandle& body(const RequestBody& body);

    HttpRequestHandle into_buffered(std::span<char> tx_buf) &&;

    // Fails with AlreadySent on every call after the first.
    std::expected<Response, HttpErrorInfo> send(std::span<char> rx_buf);

    Connection& connection() { return conn_; }
    const Url& url() const { return *url_; }

private:
    friend class HttpClient;

    HttpRequestHandle(Connection conn, std::unique_ptr<const Url> url, Method method);

    Connection conn_;
    std::unique_ptr<const Url> url_;
    std::optional<RequestBuilder> builder_;
};

// Request issued through a resource scope: borrows the scope's connection and
// carries its host and base path.
class HttpResourceRequestBuilder {
public:
    HttpResourceRequestBuilder& headers(std::span<const Header> headers);
    // Replaces the path given to HttpResource::request; still joined to the base path.
    HttpResourceRequestBuilder& path(std::string_view path);
    HttpResourceRequestBuilder& host(std::string_view host);
    HttpResourceRequestBuilder& content_type(ContentType content_type);
    HttpResourceRequestBuilder& basic_auth(std::string_view username, std::string_view password);
    HttpResourceRequestBuilder& body(const RequestBody& body);

    std::expected<Response, HttpErrorInfo> send(std::span<char> rx_buf);

private:
    friend class HttpResource;

    HttpResourceRequestBuilder(Connection& conn, std::string_view base_path, RequestBuilder builder);

    Connection* conn_;
    std::string_view base_path_;
    std::optional<RequestBuilder> builder_;
};

// Long-lived scope over one connection. Every request path is relative to the
// URL's path. Requests run strictly one after another.
class HttpResource {
public:
    HttpResource(HttpResource&&) noexcept = default;
    HttpResource& operator=(HttpResource&&) noexcept = default;
    HttpResource(const HttpResource&) = delete;
    HttpResource& operator=(const HttpResource&) = delete;

    HttpResourceRequestBuilder request(Method method, std::string_view path);
    HttpResourceRequestBuilder get(std::string_view path) { return request(Method::Get, path); }
    HttpResourceRequestBuilder post(std::string_view path) { return request(Method::Post, path); }
    HttpResourceRequestBuilder put(std::string_view path) { return request(Method::Put, path); }
    HttpResourceRequestBuilder del(std::string_view path) { return request(Method::Delete, path); }
    HttpResourceRequestBuilder head(std::string_view path) { return request(Method::Head, path); }

    // Sends a prepared request with this scope's base path applied.
    std::expected<Response, HttpErrorInfo> send(Request request, std::span<char> rx_buf);

    HttpResource into_buffered(std::span<char> tx_buf) &&;

    std::string_view host() const { return url_->host(); }
    std::string_view base_path() const { return url_->path(); }
    Connection& connection() { return conn_; }

private:
    friend class HttpClient;

    HttpResource(Connection conn, std::unique_ptr<const Url> url);

    Connection conn_;
    std::unique_ptr<const Url> url_;
};

class HttpClient {
public:
    HttpClient(Dns& dns, TcpConnector& connector);
#ifdef REQLITE_ENABLE_TLS
    HttpClient(Dns& dns, TcpConnector& connector, TlsConfig tls);
#endif

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<HttpRequestHandle, HttpErrorInfo> request(Method method, std::string_view url);
    std::expected<HttpResource, HttpErrorInfo> resource(std::string_view url);

#ifdef REQLITE_ENABLE_TLS
    const std::optional<TlsConfig>& tls_config() const { return tls_; }
#endif

private:
    std::expected<Connection, HttpErrorInfo> connect(const Url& url);

    Dns& dns_;
    TcpConnector& connector_;
#ifdef REQLITE_ENABLE_TLS
    std::optional<TlsConfig> tls_;
    // Set while a connection borrows the TLS config's buffers.
    std::shared_ptr<bool> tls_lease_;
#endif
};

} // namespace reqlite
