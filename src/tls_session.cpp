#ifdef REQLITE_ENABLE_TLS

#include "tls_session.hpp"
#include "compact_log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <arpa/inet.h>
#include <algorithm>
#include <climits>
#include <cstring>
#include <optional>
#include <string>

namespace reqlite {

namespace {

// State reachable from the BIO and PSK callbacks. Lives inside the heap-allocated
// session Impl, so its address survives moves of the session.
struct TlsChannel {
    std::unique_ptr<Transport> transport;
    std::span<char> rx_stage;
    size_t rx_pos = 0;
    size_t rx_len = 0;
    TlsVerify verify;
    std::optional<TransportErrorInfo> transport_error;
};

std::string openssl_message(const char* what) {
    std::string msg(what);
    if (unsigned long code = ERR_get_error(); code != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    }
    ERR_clear_error();
    return msg;
}

int bio_write(BIO* bio, const char* data, int len) {
    auto* channel = static_cast<TlsChannel*>(BIO_get_data(bio));
    BIO_clear_retry_flags(bio);
    auto written = write_all(*channel->transport, std::span<const char>(data, static_cast<size_t>(len)));
    if (!written) {
        channel->transport_error = std::move(written.error());
        return -1;
    }
    return len;
}

int bio_read(BIO* bio, char* out, int len) {
    auto* channel = static_cast<TlsChannel*>(BIO_get_data(bio));
    BIO_clear_retry_flags(bio);
    if (len <= 0) return 0;

    if (channel->rx_pos == channel->rx_len) {
        if (channel->rx_stage.empty()) {
            auto received = channel->transport->read(std::span<char>(out, static_cast<size_t>(len)));
            if (!received) {
                channel->transport_error = std::move(received.error());
                return -1;
            }
            return static_cast<int>(*received);
        }
        auto received = channel->transport->read(channel->rx_stage);
        if (!received) {
            channel->transport_error = std::move(received.error());
            return -1;
        }
        if (*received == 0) return 0;
        channel->rx_pos = 0;
        channel->rx_len = *received;
    }

    size_t n = std::min(static_cast<size_t>(len), channel->rx_len - channel->rx_pos);
    std::memcpy(out, channel->rx_stage.data() + channel->rx_pos, n);
    channel->rx_pos += n;
    return static_cast<int>(n);
}

long bio_ctrl(BIO* bio, int cmd, long, void*) {
    auto* channel = static_cast<TlsChannel*>(BIO_get_data(bio));
    if (cmd != BIO_CTRL_FLUSH) return 0;
    auto flushed = channel->transport->flush();
    if (!flushed) {
        channel->transport_error = std::move(flushed.error());
        return 0;
    }
    return 1;
}

int bio_create(BIO* bio) {
    BIO_set_init(bio, 1);
    return 1;
}

BIO_METHOD* transport_bio_method() {
    static BIO_METHOD* method = [] {
        BIO_METHOD* m = BIO_meth_new(BIO_get_new_index() | BIO_TYPE_SOURCE_SINK, "reqlite transport");
        if (m) {
            BIO_meth_set_write(m, bio_write);
            BIO_meth_set_read(m, bio_read);
            BIO_meth_set_ctrl(m, bio_ctrl);
            BIO_meth_set_create(m, bio_create);
        }
        return m;
    }();
    return method;
}

unsigned int psk_client_callback(SSL* ssl, const char*, char* identity, unsigned int max_identity_len,
                                 unsigned char* psk, unsigned int max_psk_len) {
    auto* channel = static_cast<TlsChannel*>(SSL_get_app_data(ssl));
    const auto& verify = channel->verify;
    if (verify.identity.size() + 1 > max_identity_len || verify.psk.size() > max_psk_len) {
        log::warn("tls: pre-shared key identity or secret too long");
        return 0;
    }
    std::memcpy(identity, verify.identity.data(), verify.identity.size());
    identity[verify.identity.size()] = '\0';
    std::memcpy(psk, verify.psk.data(), verify.psk.size());
    return static_cast<unsigned int>(verify.psk.size());
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 || inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

} // namespace

std::expected<SeedStep, TransportErrorInfo> derive_seed_step(uint64_t seed) {
    unsigned char key[32] = {};
    for (int i = 0; i < 8; ++i) key[i] = static_cast<unsigned char>(seed >> (8 * i));
    unsigned char iv[16] = {};
    unsigned char zeros[40] = {};
    unsigned char stream[40];

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return std::unexpected(TransportErrorInfo{TransportError::TlsError, openssl_message("EVP_CIPHER_CTX_new failed")});
    }
    int outl = 0;
    bool ok = EVP_EncryptInit_ex(ctx, EVP_chacha20(), nullptr, key, iv) == 1 &&
              EVP_EncryptUpdate(ctx, stream, &outl, zeros, sizeof(zeros)) == 1 &&
              outl == static_cast<int>(sizeof(stream));
    EVP_CIPHER_CTX_free(ctx);
    if (!ok) {
        return std::unexpected(TransportErrorInfo{TransportError::TlsError, openssl_message("ChaCha20 keystream failed")});
    }

    SeedStep step{};
    for (int i = 0; i < 8; ++i) step.next_seed |= static_cast<uint64_t>(stream[i]) << (8 * i);
    std::copy_n(stream + 8, step.entropy.size(), step.entropy.begin());
    return step;
}

class TlsSession::Impl {
public:
    TlsChannel channel;
    SSL_CTX* ctx = nullptr;
    SSL* ssl = nullptr;
    std::span<char> tx_plain;
    size_t tx_pos = 0;

    ~Impl() {
        if (ssl) SSL_free(ssl);
        if (ctx) SSL_CTX_free(ctx);
    }

    TransportErrorInfo failure(const char* what, int rc) {
        if (channel.transport_error) {
            auto err = std::move(*channel.transport_error);
            channel.transport_error.reset();
            ERR_clear_error();
            return err;
        }
        std::string msg = openssl_message(what);
        msg += " (ssl error ";
        msg += std::to_string(SSL_get_error(ssl, rc));
        msg += ")";
        return TransportErrorInfo{TransportError::TlsError, msg};
    }

    std::expected<void, TransportErrorInfo> write_records(std::span<const char> data) {
        while (!data.empty()) {
            int chunk = static_cast<int>(std::min<size_t>(data.size(), INT_MAX));
            int sent = SSL_write(ssl, data.data(), chunk);
            if (sent <= 0) return std::unexpected(failure("TLS write failed", sent));
            data = data.subspan(static_cast<size_t>(sent));
        }
        return {};
    }

    std::expected<void, TransportErrorInfo> drain() {
        auto result = write_records(std::span<const char>(tx_plain.data(), tx_pos));
        tx_pos = 0;
        return result;
    }
};

TlsSession::TlsSession() : pImpl_(std::make_unique<Impl>()) {}
TlsSession::~TlsSession() = default;
TlsSession::TlsSession(TlsSession&&) noexcept = default;
TlsSession& TlsSession::operator=(TlsSession&&) noexcept = default;

std::expected<TlsSession, TransportErrorInfo> TlsSession::open(
    std::unique_ptr<Transport> transport, std::string_view server_name, TlsConfig& config) {
    auto step = derive_seed_step(config.seed());
    if (!step) return std::unexpected(std::move(step.error()));
    config.set_seed(step->next_seed);
    RAND_seed(step->entropy.data(), static_cast<int>(step->entropy.size()));

    TlsSession session;
    auto& impl = *session.pImpl_;
    impl.channel.transport = std::move(transport);
    impl.channel.rx_stage = config.read_buffer();
    impl.channel.verify = config.verify();
    impl.tx_plain = config.write_buffer();

    impl.ctx = SSL_CTX_new(TLS_client_method());
    if (!impl.ctx) {
        return std::unexpected(TransportErrorInfo{TransportError::TlsError, openssl_message("SSL_CTX_new failed")});
    }
    SSL_CTX_set_min_proto_version(impl.ctx, TLS1_3_VERSION);
    SSL_CTX_set_max_proto_version(impl.ctx, TLS1_3_VERSION);
    SSL_CTX_set_options(impl.ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
    SSL_CTX_set_verify(impl.ctx, SSL_VERIFY_NONE, nullptr);
    if (SSL_CTX_set_ciphersuites(impl.ctx, "TLS_AES_128_GCM_SHA256") != 1) {
        return std::unexpected(TransportErrorInfo{TransportError::TlsError, openssl_message("Cipher suite rejected")});
    }

    impl.ssl = SSL_new(impl.ctx);
    BIO* bio = transport_bio_method() ? BIO_new(transport_bio_method()) : nullptr;
    if (!impl.ssl || !bio) {
        if (bio) BIO_free(bio);
        return std::unexpected(TransportErrorInfo{TransportError::TlsError, openssl_message("SSL_new failed")});
    }
    BIO_set_data(bio, &impl.channel);
    SSL_set_bio(impl.ssl, bio, bio);

    std::string host(server_name);
    if (!is_ip_literal(host)) SSL_set_tlsext_host_name(impl.ssl, host.c_str());

    if (impl.channel.verify.mode == TlsVerify::Mode::Psk) {
        SSL_set_app_data(impl.ssl, &impl.channel);
        SSL_set_psk_client_callback(impl.ssl, psk_client_callback);
    }

    if (int rc = SSL_connect(impl.ssl); rc <= 0) {
        auto err = impl.failure("TLS handshake failed", rc);
        err.error = TransportError::TlsError;
        log::warn("tls: handshake with ", server_name, " failed: ", err.message);
        return std::unexpected(std::move(err));
    }

    log::debug("tls: handshake with ", server_name, " complete, ", SSL_get_version(impl.ssl));
    return session;
}

bool TlsSession::is_open() const {
    return pImpl_ && pImpl_->ssl != nullptr;
}

std::expected<size_t, TransportErrorInfo> TlsSession::write(std::span<const char> data) {
    if (!is_open()) {
        return std::unexpected(TransportErrorInfo{TransportError::NotConnected, "TLS not connected"});
    }
    auto& impl = *pImpl_;
    if (data.empty()) return 0;

    if (impl.tx_pos == 0 && data.size() >= impl.tx_plain.size()) {
        if (auto sent = impl.write_records(data); !sent) return std::unexpected(std::move(sent.error()));
        return data.size();
    }

    if (impl.tx_pos == impl.tx_plain.size()) {
        if (auto drained = impl.drain(); !drained) return std::unexpected(std::move(drained.error()));
    }
    size_t n = std::min(data.size(), impl.tx_plain.size() - impl.tx_pos);
    std::copy_n(data.data(), n, impl.tx_plain.data() + impl.tx_pos);
    impl.tx_pos += n;
    return n;
}

std::expected<void, TransportErrorInfo> TlsSession::flush() {
    if (!is_open()) {
        return std::unexpected(TransportErrorInfo{TransportError::NotConnected, "TLS not connected"});
    }
    if (auto drained = pImpl_->drain(); !drained) return drained;
    return pImpl_->channel.transport->flush();
}

std::expected<size_t, TransportErrorInfo> TlsSession::read(std::span<char> buffer) {
    if (!is_open()) {
        return std::unexpected(TransportErrorInfo{TransportError::NotConnected, "TLS not connected"});
    }
    if (buffer.empty()) return 0;

    auto& impl = *pImpl_;
    int want = static_cast<int>(std::min<size_t>(buffer.size(), INT_MAX));
    int received = SSL_read(impl.ssl, buffer.data(), want);
    if (received > 0) return static_cast<size_t>(received);

    int err = SSL_get_error(impl.ssl, received);
    if (err == SSL_ERROR_ZERO_RETURN) return 0;
    if (err == SSL_ERROR_SYSCALL && !impl.channel.transport_error && ERR_peek_error() == 0) return 0;
    return std::unexpected(impl.failure("TLS read failed", received));
}

void TlsSession::close() {
    if (!pImpl_) return;
    if (pImpl_->ssl) {
        if (SSL_shutdown(pImpl_->ssl) < 0) {
            log::debug("tls: close_notify not delivered");
            ERR_clear_error();
        }
        SSL_free(pImpl_->ssl);
        pImpl_->ssl = nullptr;
    }
    if (pImpl_->channel.transport) pImpl_->channel.transport->close();
}

} // namespace reqlite

#endif // REQLITE_ENABLE_TLS
