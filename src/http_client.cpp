#include "http_client.hpp"
#include "compact_log.hpp"

namespace reqlite {

namespace {

HttpErrorInfo already_sent() {
    return setup_error(HttpError::AlreadySent, "Request was already sent on this handle");
}

// Nothing was written yet, so none of these poison the connection.
HttpErrorInfo classify(HttpError error, TransportErrorInfo info) {
    return HttpErrorInfo{error, std::move(info.message), info.error, false};
}

} // namespace

HttpRequestHandle::HttpRequestHandle(Connection conn, std::unique_ptr<const Url> url, Method method)
    : conn_(std::move(conn)), url_(std::move(url)) {
    builder_.emplace(method, url_->path());
    builder_->host(url_->host());
}

HttpRequestHandle& HttpRequestHandle::headers(std::span<const Header> headers) {
    if (builder_) builder_->headers(headers);
    return *this;
}

HttpRequestHandle& HttpRequestHandle::path(std::string_view path) {
    if (builder_) builder_->path(path);
    return *this;
}

HttpRequestHandle& HttpRequestHandle::host(std::string_view host) {
    if (builder_) builder_->host(host);
    return *this;
}

HttpRequestHandle& HttpRequestHandle::content_type(ContentType content_type) {
    if (builder_) builder_->content_type(content_type);
    return *this;
}

HttpRequestHandle& HttpRequestHandle::basic_auth(std::string_view username, std::string_view password) {
    if (builder_) builder_->basic_auth(username, password);
    return *this;
}

HttpRequestHandle& HttpRequestHandle::body(const RequestBody& body) {
    if (builder_) builder_->body(body);
    return *this;
}

HttpRequestHandle HttpRequestHandle::into_buffered(std::span<char> tx_buf) && {
    conn_ = std::move(conn_).into_buffered(tx_buf);
    return std::move(*this);
}

std::expected<Response, HttpErrorInfo> HttpRequestHandle::send(std::span<char> rx_buf) {
    if (!builder_) return std::unexpected(already_sent());
    Request request = builder_->build();
    builder_.reset();
    return conn_.send(request, rx_buf);
}

HttpResourceRequestBuilder::HttpResourceRequestBuilder(Connection& conn, std::string_view base_path,
                                                       RequestBuilder builder)
    : conn_(&conn), base_path_(base_path), builder_(std::move(builder)) {}

HttpResourceRequestBuilder& HttpResourceRequestBuilder::headers(std::span<const Header> headers) {
    if (builder_) builder_->headers(headers);
    return *this;
}

HttpResourceRequestBuilder& HttpResourceRequestBuilder::path(std::string_view path) {
    if (builder_) builder_->path(path);
    return *this;
}

HttpResourceRequestBuilder& HttpResourceRequestBuilder::host(std::string_view host) {
    if (builder_) builder_->host(host);
    return *this;
}

HttpResourceRequestBuilder& HttpResourceRequestBuilder::content_type(ContentType content_type) {
    if (builder_) builder_->content_type(content_type);
    return *this;
}

HttpResourceRequestBuilder& HttpResourceRequestBuilder::basic_auth(std::string_view username,
                                                                   std::string_view password) {
    if (builder_) builder_->basic_auth(username, password);
    return *this;
}

HttpResourceRequestBuilder& HttpResourceRequestBuilder::body(const RequestBody& body) {
    if (builder_) builder_->body(body);
    return *this;
}

std::expected<Response, HttpErrorInfo> HttpResourceRequestBuilder::send(std::span<char> rx_buf) {
    if (!builder_) return std::unexpected(already_sent());
    Request request = builder_->build();
    builder_.reset();
    request.base_path = base_path_;
    return conn_->send(request, rx_buf);
}

HttpResource::HttpResource(Connection conn, std::unique_ptr<const Url> url)
    : conn_(std::move(conn)), url_(std::move(url)) {}

HttpResourceRequestBuilder HttpResource::request(Method method, std::string_view path) {
    RequestBuilder builder(method, path);
    builder.host(url_->host());
    return HttpResourceRequestBuilder(conn_, url_->path(), std::move(builder));
}

std::expected<Response, HttpErrorInfo> HttpResource::send(Request request, std::span<char> rx_buf) {
    request.base_path = url_->path();
    if (!request.host) request.host = url_->host();
    return conn_.send(request, rx_buf);
}

HttpResource HttpResource::into_buffered(std::span<char> tx_buf) && {
    conn_ = std::move(conn_).into_buffered(tx_buf);
    return std::move(*this);
}

HttpClient::HttpClient(Dns& dns, TcpConnector& connector) : dns_(dns), connector_(connector) {}

#ifdef REQLITE_ENABLE_TLS
HttpClient::HttpClient(Dns& dns, TcpConnector& connector, TlsConfig tls)
    : dns_(dns), connector_(connector), tls_(tls), tls_lease_(std::make_shared<bool>(false)) {}
#endif

std::expected<Connection, HttpErrorInfo> HttpClient::connect(const Url& url) {
    if (url.scheme() == UrlScheme::Https) {
#ifdef REQLITE_ENABLE_TLS
        if (!tls_) {
            return std::unexpected(setup_error(HttpError::UnsupportedScheme,
                "https requires a TLS configuration on the client"));
        }
#else
        return std::unexpected(setup_error(HttpError::UnsupportedScheme,
            "https is not available in this build"));
#endif
    }

#ifdef REQLITE_ENABLE_TLS
    // http and https both borrow the TLS buffers when a config is present.
    if (tls_ && *tls_lease_) {
        return std::unexpected(setup_error(HttpError::TlsBuffersInUse,
            "TLS buffers are held by another live connection; close it first"));
    }
#endif

    auto address = dns_.resolve(url.host());
    if (!address) {
        log::debug("client: resolve ", url.host(), " failed: ", address.error().message);
        return std::unexpected(classify(HttpError::Dns, std::move(address.error())));
    }

    char addr_buf[64];
    std::string_view addr_text = address->format(addr_buf);
    log::debug("client: ", url.host(), " -> ", addr_text, ":", url.port_or_default());

    auto transport = connector_.connect(*address, url.port_or_default());
    if (!transport) {
        log::debug("client: connect ", addr_text, " failed: ", transport.error().message);
        return std::unexpected(classify(HttpError::Network, std::move(transport.error())));
    }

#ifdef REQLITE_ENABLE_TLS
    if (url.scheme() == UrlScheme::Https) {
        auto session = TlsSession::open(std::move(*transport), url.host(), *tls_);
        if (!session) {
            log::warn("client: TLS handshake with ", url.host(), " failed: ", session.error().message);
            return std::unexpected(classify(HttpError::Tls, std::move(session.error())));
        }
        log::info("client: connected to ", url.host(), ":", url.port_or_default(), " (Tls)");
        Connection conn = Connection::tls(std::move(*session));
        conn.hold(BufferLease(tls_lease_));
        return conn;
    }

    if (tls_) {
        log::info("client: connected to ", url.host(), ":", url.port_or_default(), " (PlainBuffered)");
        Connection conn = Connection::buffered(std::move(*transport), tls_->write_buffer());
        conn.hold(BufferLease(tls_lease_));
        return conn;
    }
#endif

    log::info("client: connected to ", url.host(), ":", url.port_or_default(), " (Plain)");
    return Connection::plain(std::move(*transport));
}

std::expected<HttpRequestHandle, HttpErrorInfo> HttpClient::request(Method method, std::string_view url) {
    auto parsed = Url::parse(url);
    if (!parsed) return std::unexpected(std::move(parsed.error()));
    auto owned = std::make_unique<const Url>(std::move(*parsed));

    auto conn = connect(*owned);
    if (!conn) return std::unexpected(std::move(conn.error()));
    return HttpRequestHandle(std::move(*conn), std::move(owned), method);
}

std::expected<HttpResource, HttpErrorInfo> HttpClient::resource(std::string_view url) {
    auto parsed = Url::parse(url);
    if (!parsed) return std::unexpected(std::move(parsed.error()));
    auto owned = std::make_unique<const Url>(std::move(*parsed));

    auto conn = connect(*owned);
    if (!conn) return std::unexpected(std::move(conn.error()));
    return HttpResource(std::move(*conn), std::move(owned));
}

} // namespace reqlite
