#include "buffered_write.hpp"
#include <algorithm>

namespace reqlite {

BufferedWrite::BufferedWrite(std::unique_ptr<Transport> inner, std::span<char> buffer)
    : inner_(std::move(inner)), buffer_(buffer) {}

std::expected<size_t, TransportErrorInfo> BufferedWrite::read(std::span<char> buffer) {
    return inner_->read(buffer);
}

std::expected<size_t, TransportErrorInfo> BufferedWrite::write(std::span<const char> data) {
    if (data.empty()) return 0;

    // Nothing to coalesce with and too big to fit: skip the copy.
    if (pos_ == 0 && data.size() >= buffer_.size()) {
        return inner_->write(data);
    }

    if (pos_ == buffer_.size()) {
        if (auto drained = drain(); !drained) return std::unexpected(std::move(drained.error()));
    }

    size_t n = std::min(data.size(), buffer_.size() - pos_);
    std::copy_n(data.data(), n, buffer_.data() + pos_);
    pos_ += n;

    if (pos_ == buffer_.size()) {
        if (auto drained = drain(); !drained) return std::unexpected(std::move(drained.error()));
    }
    return n;
}

std::expected<void, TransportErrorInfo> BufferedWrite::flush() {
    if (auto drained = drain(); !drained) return drained;
    return inner_->flush();
}

void BufferedWrite::close() {
    pos_ = 0;
    inner_->close();
}

std::expected<void, TransportErrorInfo> BufferedWrite::drain() {
    auto result = write_all(*inner_, std::span<const char>(buffer_.data(), pos_));
    pos_ = 0;
    return result;
}

} // namespace reqlite
