#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>

namespace reqlite {

enum class Method { Get, Post, Put, Delete, Head, Options, Connect, Trace, Patch };

std::string_view to_string(Method method);

enum class ContentType {
    TextPlain,
    TextHtml,
    TextCss,
    TextCsv,
    ApplicationJson,
    ApplicationCbor,
    ApplicationOctetStream,
    ApplicationXWwwFormUrlencoded,
    MultipartFormData
};

std::string_view to_string(ContentType type);

// Parameters after ';' are ignored, matching is case-insensitive.
std::optional<ContentType> content_type_from_str(std::string_view value);

struct StatusCode {
    uint16_t code = 0;

    bool is_informational() const { return code >= 100 && code < 200; }
    bool is_success() const { return code >= 200 && code < 300; }
    bool is_redirection() const { return code >= 300 && code < 400; }
    bool is_client_error() const { return code >= 400 && code < 500; }
    bool is_server_error() const { return code >= 500 && code < 600; }

    // 1xx, 204 and 304 never carry a body.
    bool has_body() const { return !is_informational() && code != 204 && code != 304; }

    friend bool operator==(StatusCode a, StatusCode b) { return a.code == b.code; }
    friend bool operator==(StatusCode a, uint16_t b) { return a.code == b; }
};

// Views into caller-owned storage.
struct Header {
    std::string_view name;
    std::string_view value;
};

bool iequals(std::string_view a, std::string_view b);
std::string_view trim(std::string_view s);

// Case-insensitive search for token in a comma separated list.
bool contains_token(std::string_view list, std::string_view token);

// Iterates the "Name: Value\r\n" lines of an already validated header block.
class HeaderBlock {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Header;
        using difference_type = std::ptrdiff_t;
        using pointer = const Header*;
        using reference = const Header&;

        iterator() = default;
        explicit iterator(std::string_view rest) : rest_(rest) { advance(); }

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        iterator& operator++() { advance(); return *this; }
        iterator operator++(int) { auto tmp = *this; advance(); return tmp; }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.done_ == b.done_ && (a.done_ || a.rest_.data() == b.rest_.data());
        }

    private:
        void advance();

        std::string_view rest_;
        Header current_;
        bool done_ = true;
    };

    HeaderBlock() = default;
    explicit HeaderBlock(std::string_view raw) : raw_(raw) {}

    iterator begin() const { return iterator(raw_); }
    iterator end() const { return iterator(); }

    std::optional<std::string_view> find(std::string_view name) const;
    size_t count() const;
    std::string_view raw() const { return raw_; }

private:
    std::string_view raw_;
};

} // namespace reqlite
