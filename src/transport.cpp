#include "transport.hpp"
#include <charconv>

namespace reqlite {

std::string_view to_string(TransportError error) {
    switch (error) {
        case TransportError::ConnectionFailed: return "connection failed";
        case TransportError::DnsError: return "dns error";
        case TransportError::ReadError: return "read error";
        case TransportError::WriteError: return "write error";
        case TransportError::TimeoutError: return "timeout";
        case TransportError::ConnectionReset: return "connection reset";
        case TransportError::UnexpectedEof: return "unexpected end of stream";
        case TransportError::NotConnected: return "not connected";
        case TransportError::TlsError: return "tls error";
    }
    return "unknown";
}

IpAddress IpAddress::v4(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
    IpAddress address;
    address.octets[0] = a;
    address.octets[1] = b;
    address.octets[2] = c;
    address.octets[3] = d;
    return address;
}

std::string_view IpAddress::format(std::span<char> out) const {
    char* pos = out.data();
    char* end = out.data() + out.size();

    auto put = [&](unsigned value, int base) {
        auto [ptr, ec] = std::to_chars(pos, end, value, base);
        if (ec == std::errc()) pos = ptr;
    };
    auto sep = [&](char c) {
        if (pos < end) *pos++ = c;
    };

    if (family == Family::V4) {
        for (int i = 0; i < 4; ++i) {
            if (i) sep('.');
            put(octets[i], 10);
        }
    } else {
        for (int i = 0; i < 16; i += 2) {
            if (i) sep(':');
            put((static_cast<unsigned>(octets[i]) << 8) | octets[i + 1], 16);
        }
    }
    return {out.data(), static_cast<size_t>(pos - out.data())};
}

} // namespace reqlite
