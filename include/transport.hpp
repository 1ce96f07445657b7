#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace reqlite {

enum class TransportError {
    ConnectionFailed,
    DnsError,
    ReadError,
    WriteError,
    TimeoutError,
    ConnectionReset,
    UnexpectedEof,
    NotConnected,
    TlsError
};

struct TransportErrorInfo {
    TransportError error;
    std::string message;
};

std::string_view to_string(TransportError error);

// Byte-stream capability every connection form is built on.
// read() returning 0 means end of stream.
class Transport {
public:
    virtual ~Transport() = default;
    virtual std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) = 0;
    virtual std::expected<size_t, TransportErrorInfo> write(std::span<const char> data) = 0;
    virtual std::expected<void, TransportErrorInfo> flush() = 0;
    virtual void close() = 0;
};

struct IpAddress {
    enum class Family { V4, V6 };

    Family family = Family::V4;
    std::array<uint8_t, 16> octets{};

    static IpAddress v4(uint8_t a, uint8_t b, uint8_t c, uint8_t d);

    // Dotted quad or RFC 5952-ish hex groups, written into out. Returns the used prefix.
    std::string_view format(std::span<char> out) const;
};

class Dns {
public:
    virtual ~Dns() = default;
    virtual std::expected<IpAddress, TransportErrorInfo> resolve(std::string_view host) = 0;
};

class TcpConnector {
public:
    virtual ~TcpConnector() = default;
    virtual std::expected<std::unique_ptr<Transport>, TransportErrorInfo> connect(
        const IpAddress& address, uint16_t port) = 0;
};

// Loops over partial writes. A transport accepting zero bytes is a WriteError.
template<typename Stream>
std::expected<void, TransportErrorInfo> write_all(Stream& stream, std::span<const char> data) {
    while (!data.empty()) {
        auto written = stream.write(data);
        if (!written) return std::unexpected(std::move(written.error()));
        if (*written == 0) {
            return std::unexpected(TransportErrorInfo{TransportError::WriteError, "Write accepted zero bytes"});
        }
        data = data.subspan(*written);
    }
    return {};
}

template<typename Stream>
std::expected<void, TransportErrorInfo> write_all(Stream& stream, std::string_view text) {
    return write_all(stream, std::span<const char>(text.data(), text.size()));
}

} // namespace reqlite
