#pragma once

#include "http_error.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace reqlite {

enum class UrlScheme { Http, Https };

// Decomposed absolute URL. Owns its strings; views handed out stay valid for
// the Url's lifetime and across moves only if the Url is held by pointer.
class Url {
public:
    // Only http and https are accepted; other schemes yield UnsupportedScheme.
    static std::expected<Url, HttpErrorInfo> parse(std::string_view text);

    UrlScheme scheme() const { return scheme_; }
    std::string_view host() const { return host_; }
    uint16_t port_or_default() const { return port_; }
    // Path plus query, "/" when the URL has none.
    std::string_view path() const { return path_; }

private:
    UrlScheme scheme_ = UrlScheme::Http;
    std::string host_;
    uint16_t port_ = 80;
    std::string path_;
};

std::string_view to_string(UrlScheme scheme);
uint16_t default_port(UrlScheme scheme);

} // namespace reqlite
