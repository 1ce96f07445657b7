#include "url.hpp"
#include <curl/curl.h>
#include <charconv>
#include <memory>

namespace reqlite {

namespace {

struct UrlHandleDeleter {
    void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};

struct CurlStringDeleter {
    void operator()(char* s) const { curl_free(s); }
};

using UrlHandle = std::unique_ptr<CURLU, UrlHandleDeleter>;
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

HttpErrorInfo url_error(std::string_view text, CURLUcode code) {
    std::string msg = "Invalid URL '";
    msg += text;
    msg += "': ";
    msg += curl_url_strerror(code);
    return setup_error(HttpError::InvalidUrl, std::move(msg));
}

// Missing optional parts come back as a null string, not an error.
std::expected<CurlString, CURLUcode> get_part(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    CURLUcode rc = curl_url_get(handle, part, &value, flags);
    if (rc == CURLUE_OK) return CurlString(value);
    if (rc == CURLUE_NO_QUERY || rc == CURLUE_NO_PORT) return CurlString();
    return std::unexpected(rc);
}

} // namespace

std::string_view to_string(UrlScheme scheme) {
    return scheme == UrlScheme::Https ? "https" : "http";
}

uint16_t default_port(UrlScheme scheme) {
    return scheme == UrlScheme::Https ? 443 : 80;
}

std::expected<Url, HttpErrorInfo> Url::parse(std::string_view text) {
    UrlHandle handle(curl_url());
    if (!handle) return std::unexpected(setup_error(HttpError::InvalidUrl, "Failed to allocate URL handle"));

    std::string input(text);
    // NON_SUPPORT_SCHEME lets us report unknown schemes ourselves.
    if (CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, input.c_str(), CURLU_NON_SUPPORT_SCHEME);
        rc != CURLUE_OK) {
        return std::unexpected(url_error(text, rc));
    }

    auto scheme = get_part(handle.get(), CURLUPART_SCHEME);
    if (!scheme || !*scheme) return std::unexpected(url_error(text, scheme ? CURLUE_NO_SCHEME : scheme.error()));

    Url url;
    std::string_view scheme_name(scheme->get());
    if (scheme_name == "http") {
        url.scheme_ = UrlScheme::Http;
    } else if (scheme_name == "https") {
        url.scheme_ = UrlScheme::Https;
    } else {
        std::string msg = "Unsupported URL scheme '";
        msg += scheme_name;
        msg += "'";
        return std::unexpected(setup_error(HttpError::UnsupportedScheme, std::move(msg)));
    }

    auto host = get_part(handle.get(), CURLUPART_HOST);
    if (!host || !*host) return std::unexpected(url_error(text, host ? CURLUE_NO_HOST : host.error()));
    url.host_ = host->get();

    auto port = get_part(handle.get(), CURLUPART_PORT);
    if (!port) return std::unexpected(url_error(text, port.error()));
    url.port_ = default_port(url.scheme_);
    if (*port) {
        std::string_view digits(port->get());
        uint16_t value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc() || ptr != digits.data() + digits.size()) {
            return std::unexpected(url_error(text, CURLUE_BAD_PORT_NUMBER));
        }
        url.port_ = value;
    }

    auto path = get_part(handle.get(), CURLUPART_PATH);
    if (!path) return std::unexpected(url_error(text, path.error()));
    url.path_ = (*path && *path->get()) ? path->get() : "/";

    auto query = get_part(handle.get(), CURLUPART_QUERY);
    if (!query) return std::unexpected(url_error(text, query.error()));
    if (*query) {
        url.path_ += '?';
        url.path_ += query->get();
    }

    return url;
}

} // namespace reqlite
