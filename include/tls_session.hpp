#pragma once

#ifdef REQLITE_ENABLE_TLS

#include "transport.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string_view>

namespace reqlite {

struct TlsVerify {
    enum class Mode { None, Psk };

    Mode mode = Mode::None;
    std::span<const uint8_t> identity;
    std::span<const uint8_t> psk;

    static TlsVerify none() { return {}; }

    static TlsVerify pre_shared_key(std::span<const uint8_t> identity, std::span<const uint8_t> psk) {
        return TlsVerify{Mode::Psk, identity, psk};
    }
};

// Seed plus borrowed scratch buffers. The buffers must outlive every
// connection opened with this configuration.
class TlsConfig {
public:
    TlsConfig(uint64_t seed, std::span<char> read_buffer, std::span<char> write_buffer,
              TlsVerify verify = TlsVerify::none())
        : seed_(seed), read_buffer_(read_buffer), write_buffer_(write_buffer), verify_(verify) {}

    uint64_t seed() const { return seed_; }
    void set_seed(uint64_t seed) { seed_ = seed; }
    std::span<char> read_buffer() const { return read_buffer_; }
    std::span<char> write_buffer() const { return write_buffer_; }
    const TlsVerify& verify() const { return verify_; }

private:
    uint64_t seed_;
    std::span<char> read_buffer_;
    std::span<char> write_buffer_;
    TlsVerify verify_;
};

struct SeedStep {
    uint64_t next_seed;
    std::array<uint8_t, 32> entropy;
};

// ChaCha20 keystream keyed by seed: bytes [0, 8) become the next seed,
// bytes [8, 40) are mixed into the handshake's random generator.
std::expected<SeedStep, TransportErrorInfo> derive_seed_step(uint64_t seed);

// TLS 1.3 client session layered over any Transport through a custom BIO.
class TlsSession : public Transport {
public:
    // Advances config's seed, then performs the handshake.
    static std::expected<TlsSession, TransportErrorInfo> open(
        std::unique_ptr<Transport> transport, std::string_view server_name, TlsConfig& config);

    ~TlsSession() override;

    TlsSession(TlsSession&&) noexcept;
    TlsSession& operator=(TlsSession&&) noexcept;

    TlsSession(const TlsSession&) = delete;
    TlsSession& operator=(const TlsSession&) = delete;

    std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) override;
    std::expected<size_t, TransportErrorInfo> write(std::span<const char> data) override;
    std::expected<void, TransportErrorInfo> flush() override;
    void close() override;

    bool is_open() const;

private:
    TlsSession();

    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace reqlite

#endif // REQLITE_ENABLE_TLS
