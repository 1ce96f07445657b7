#include "socket_wrapper.hpp"
#include "compact_log.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace reqlite {

namespace {

TransportError classify_errno(int err, TransportError fallback) {
    switch (err) {
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
        case ETIMEDOUT:
            return TransportError::TimeoutError;
        case ECONNRESET:
        case EPIPE:
            return TransportError::ConnectionReset;
        case ENOTCONN:
            return TransportError::NotConnected;
        default:
            return fallback;
    }
}

std::string errno_message(const char* what, int err) {
    std::string msg(what);
    msg += ": ";
    msg += std::strerror(err);
    return msg;
}

} // namespace

class Socket::Impl {
public:
    int fd = -1;
    SocketConfig config;

    ~Impl() { if (fd >= 0) ::close(fd); }

    void apply_options() const {
        timeval tv{config.timeout_sec, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        int flag = config.tcp_nodelay ? 1 : 0;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    }
};

Socket::Socket() : pImpl_(std::make_unique<Impl>()) {}
Socket::Socket(int fd) : pImpl_(std::make_unique<Impl>()) { pImpl_->fd = fd; }
Socket::~Socket() = default;
Socket::Socket(Socket&&) noexcept = default;
Socket& Socket::operator=(Socket&&) noexcept = default;

void Socket::set_config(const SocketConfig& config) {
    pImpl_->config = config;
    if (pImpl_->fd >= 0) pImpl_->apply_options();
}

bool Socket::is_open() const {
    return pImpl_->fd >= 0;
}

void Socket::close() {
    if (pImpl_->fd >= 0) {
        ::close(pImpl_->fd);
        pImpl_->fd = -1;
    }
}

int Socket::fd() const {
    return pImpl_->fd;
}

std::expected<void, TransportErrorInfo> Socket::connect(const IpAddress& address, uint16_t port) {
    sockaddr_storage storage{};
    socklen_t len = 0;
    if (address.family == IpAddress::Family::V4) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&storage);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        std::memcpy(&sin->sin_addr, address.octets.data(), 4);
        len = sizeof(sockaddr_in);
    } else {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&storage);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        std::memcpy(&sin6->sin6_addr, address.octets.data(), 16);
        len = sizeof(sockaddr_in6);
    }

    close();
    pImpl_->fd = ::socket(storage.ss_family, SOCK_STREAM, 0);
    if (pImpl_->fd < 0) {
        return std::unexpected(TransportErrorInfo{TransportError::ConnectionFailed,
            errno_message("Failed to create socket", errno)});
    }
    pImpl_->apply_options();

    if (::connect(pImpl_->fd, reinterpret_cast<sockaddr*>(&storage), len) < 0) {
        int err = errno;
        close();
        char text[64];
        std::string msg = "Connection failed to ";
        msg += address.format(text);
        msg += ":";
        msg += std::to_string(port);
        msg += ": ";
        msg += std::strerror(err);
        return std::unexpected(TransportErrorInfo{
            err == ETIMEDOUT ? TransportError::TimeoutError : TransportError::ConnectionFailed, msg});
    }

    return {};
}

std::expected<size_t, TransportErrorInfo> Socket::write(std::span<const char> data) {
    if (pImpl_->fd < 0) {
        return std::unexpected(TransportErrorInfo{TransportError::NotConnected, "Socket not connected"});
    }

    ssize_t sent;
    do {
        sent = ::send(pImpl_->fd, data.data(), data.size(), MSG_NOSIGNAL);
    } while (sent < 0 && errno == EINTR);
    if (sent < 0) {
        int err = errno;
        return std::unexpected(TransportErrorInfo{classify_errno(err, TransportError::WriteError),
            errno_message("Write failed", err)});
    }
    return static_cast<size_t>(sent);
}

std::expected<size_t, TransportErrorInfo> Socket::read(std::span<char> buffer) {
    if (pImpl_->fd < 0) {
        return std::unexpected(TransportErrorInfo{TransportError::NotConnected, "Socket not connected"});
    }

    ssize_t received;
    do {
        received = ::recv(pImpl_->fd, buffer.data(), buffer.size(), 0);
    } while (received < 0 && errno == EINTR);
    if (received < 0) {
        int err = errno;
        return std::unexpected(TransportErrorInfo{classify_errno(err, TransportError::ReadError),
            errno_message("Read failed", err)});
    }
    return static_cast<size_t>(received);
}

// Writes go straight to the kernel; TCP_NODELAY controls coalescing there.
std::expected<void, TransportErrorInfo> Socket::flush() {
    if (pImpl_->fd < 0) {
        return std::unexpected(TransportErrorInfo{TransportError::NotConnected, "Socket not connected"});
    }
    return {};
}

std::expected<IpAddress, TransportErrorInfo> PosixDns::resolve(std::string_view host) {
    std::string name(host);
    // Bracketed IPv6 literals come straight from URLs.
    if (name.size() > 2 && name.front() == '[' && name.back() == ']') {
        name = name.substr(1, name.size() - 2);
    }

    addrinfo hints{}, *result = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    if (int rc = getaddrinfo(name.c_str(), nullptr, &hints, &result); rc != 0) {
        std::string msg = "Failed to resolve host: ";
        msg += name;
        msg += " (";
        msg += gai_strerror(rc);
        msg += ")";
        return std::unexpected(TransportErrorInfo{TransportError::DnsError, msg});
    }

    IpAddress address;
    if (result->ai_family == AF_INET6) {
        address.family = IpAddress::Family::V6;
        auto* sin6 = reinterpret_cast<const sockaddr_in6*>(result->ai_addr);
        std::memcpy(address.octets.data(), &sin6->sin6_addr, 16);
    } else {
        auto* sin = reinterpret_cast<const sockaddr_in*>(result->ai_addr);
        std::memcpy(address.octets.data(), &sin->sin_addr, 4);
    }
    freeaddrinfo(result);

    char text[64];
    log::debug("dns: ", host, " -> ", address.format(text));
    return address;
}

std::expected<std::unique_ptr<Transport>, TransportErrorInfo> PosixConnector::connect(
    const IpAddress& address, uint16_t port) {
    auto socket = std::make_unique<Socket>();
    socket->set_config(config_);
    if (auto conn = socket->connect(address, port); !conn) {
        return std::unexpected(std::move(conn.error()));
    }
    return socket;
}

} // namespace reqlite
