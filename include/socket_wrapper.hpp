#pragma once

#include "transport.hpp"
#include <memory>

namespace reqlite {

struct SocketConfig {
    int timeout_sec = 30;
    bool tcp_nodelay = true;
};

class Socket : public Transport {
public:
    Socket();
    explicit Socket(int fd);
    ~Socket() override;

    Socket(Socket&&) noexcept;
    Socket& operator=(Socket&&) noexcept;

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    std::expected<void, TransportErrorInfo> connect(const IpAddress& address, uint16_t port);
    std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) override;
    std::expected<size_t, TransportErrorInfo> write(std::span<const char> data) override;
    std::expected<void, TransportErrorInfo> flush() override;

    void set_config(const SocketConfig& config);
    void close() override;
    bool is_open() const;
    int fd() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// getaddrinfo-backed resolver; the first returned address wins.
class PosixDns : public Dns {
public:
    std::expected<IpAddress, TransportErrorInfo> resolve(std::string_view host) override;
};

class PosixConnector : public TcpConnector {
public:
    PosixConnector() = default;
    explicit PosixConnector(SocketConfig config) : config_(config) {}

    std::expected<std::unique_ptr<Transport>, TransportErrorInfo> connect(
        const IpAddress& address, uint16_t port) override;

private:
    SocketConfig config_;
};

} // namespace reqlite
