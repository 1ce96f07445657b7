#include "headers.hpp"
#include <array>
#include <utility>

namespace reqlite {

namespace {

char lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

constexpr std::array<std::pair<ContentType, std::string_view>, 9> kContentTypes{{
    {ContentType::TextPlain, "text/plain"},
    {ContentType::TextHtml, "text/html"},
    {ContentType::TextCss, "text/css"},
    {ContentType::TextCsv, "text/csv"},
    {ContentType::ApplicationJson, "application/json"},
    {ContentType::ApplicationCbor, "application/cbor"},
    {ContentType::ApplicationOctetStream, "application/octet-stream"},
    {ContentType::ApplicationXWwwFormUrlencoded, "application/x-www-form-urlencoded"},
    {ContentType::MultipartFormData, "multipart/form-data"},
}};

} // namespace

std::string_view to_string(Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
        case Method::Put: return "PUT";
        case Method::Delete: return "DELETE";
        case Method::Head: return "HEAD";
        case Method::Options: return "OPTIONS";
        case Method::Connect: return "CONNECT";
        case Method::Trace: return "TRACE";
        case Method::Patch: return "PATCH";
    }
    return "GET";
}

std::string_view to_string(ContentType type) {
    for (const auto& [t, name] : kContentTypes) {
        if (t == type) return name;
    }
    return "application/octet-stream";
}

std::optional<ContentType> content_type_from_str(std::string_view value) {
    if (auto semi = value.find(';'); semi != std::string_view::npos) value = value.substr(0, semi);
    value = trim(value);
    for (const auto& [t, name] : kContentTypes) {
        if (iequals(value, name)) return t;
    }
    return std::nullopt;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (lower(a[i]) != lower(b[i])) return false;
    }
    return true;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool contains_token(std::string_view list, std::string_view token) {
    while (!list.empty()) {
        auto comma = list.find(',');
        auto item = trim(list.substr(0, comma));
        if (auto semi = item.find(';'); semi != std::string_view::npos) item = trim(item.substr(0, semi));
        if (iequals(item, token)) return true;
        if (comma == std::string_view::npos) break;
        list.remove_prefix(comma + 1);
    }
    return false;
}

void HeaderBlock::iterator::advance() {
    while (!rest_.empty()) {
        auto eol = rest_.find("\r\n");
        auto line = rest_.substr(0, eol);
        rest_ = eol == std::string_view::npos ? rest_.substr(rest_.size()) : rest_.substr(eol + 2);

        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        current_ = Header{trim(line.substr(0, colon)), trim(line.substr(colon + 1))};
        done_ = false;
        return;
    }
    done_ = true;
}

std::optional<std::string_view> HeaderBlock::find(std::string_view name) const {
    for (const auto& header : *this) {
        if (iequals(header.name, name)) return header.value;
    }
    return std::nullopt;
}

size_t HeaderBlock::count() const {
    size_t n = 0;
    for (auto it = begin(); it != end(); ++it) ++n;
    return n;
}

} // namespace reqlite
