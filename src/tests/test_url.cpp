#include "url.hpp"
#include <cassert>
#include <iostream>

using namespace reqlite;

void test_plain_http() {
    auto url = Url::parse("http://example.com");
    assert(url);
    assert(url->scheme() == UrlScheme::Http);
    assert(url->host() == "example.com");
    assert(url->port_or_default() == 80);
    assert(url->path() == "/");
    std::cout << "✓ http URL with defaults\n";
}

void test_https_with_port_and_query() {
    auto url = Url::parse("https://api.example.com:8443/v1/items?limit=10&page=2");
    assert(url);
    assert(url->scheme() == UrlScheme::Https);
    assert(url->host() == "api.example.com");
    assert(url->port_or_default() == 8443);
    assert(url->path() == "/v1/items?limit=10&page=2");

    auto defaulted = Url::parse("https://example.com/a");
    assert(defaulted && defaulted->port_or_default() == 443);
    std::cout << "✓ https URL with port, path and query\n";
}

void test_base_path_kept() {
    auto url = Url::parse("http://example.com/api");
    assert(url && url->path() == "/api");
    auto slash = Url::parse("http://example.com/api/");
    assert(slash && slash->path() == "/api/");
    std::cout << "✓ Path kept verbatim\n";
}

void test_unsupported_scheme() {
    auto url = Url::parse("ftp://example.com/file");
    assert(!url);
    assert(url.error().error == HttpError::UnsupportedScheme);
    assert(url.error().retry_safe());
    std::cout << "✓ Unsupported scheme rejected\n";
}

void test_invalid() {
    auto relative = Url::parse("example.com/path");
    assert(!relative && relative.error().error == HttpError::InvalidUrl);

    auto port = Url::parse("http://example.com:99999/");
    assert(!port && port.error().error == HttpError::InvalidUrl);

    auto letters = Url::parse("http://example.com:abc/");
    assert(!letters && letters.error().error == HttpError::InvalidUrl);
    assert(!letters.error().message.empty());
    std::cout << "✓ Invalid URLs rejected\n";
}

int main() {
    try {
        test_plain_http();
        test_https_with_port_and_query();
        test_base_path_kept();
        test_unsupported_scheme();
        test_invalid();
        std::cout << "\n✓ All URL tests passed\n";
    } catch (const std::exception& e) {
        std::cerr << "✗ " << e.what() << "\n";
        return 1;
    }
    return 0;
}
