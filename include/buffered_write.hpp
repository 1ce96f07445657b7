#pragma once

#include "transport.hpp"
#include <memory>

namespace reqlite {

// Coalesces writes into a caller-supplied buffer. The buffer is drained to the
// inner transport when it fills up or on flush(); reads pass through.
class BufferedWrite : public Transport {
public:
    BufferedWrite(std::unique_ptr<Transport> inner, std::span<char> buffer);

    BufferedWrite(BufferedWrite&&) noexcept = default;
    BufferedWrite& operator=(BufferedWrite&&) noexcept = default;

    std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) override;
    std::expected<size_t, TransportErrorInfo> write(std::span<const char> data) override;
    std::expected<void, TransportErrorInfo> flush() override;
    void close() override;

    size_t pending() const { return pos_; }
    size_t capacity() const { return buffer_.size(); }
    Transport& inner() { return *inner_; }

private:
    std::expected<void, TransportErrorInfo> drain();

    std::unique_ptr<Transport> inner_;
    std::span<char> buffer_;
    size_t pos_ = 0;
};

} // namespace reqlite
