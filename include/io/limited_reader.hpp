#pragma once
#include "io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>

namespace migfetch {

// Reports end-of-data after `limit` bytes even if the inner source has more.
// Owns the inner reader and releases it exactly once, on Close() or
// destruction, however much was read.
class LimitedReader final : public IReader {
public:
    LimitedReader(std::unique_ptr<IReader> inner, std::uint64_t limit)
        : inner_(std::move(inner)), remaining_(limit) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (!inner_ || remaining_ == 0) return 0;
        if (out.size() > remaining_) out = out.first(static_cast<size_t>(remaining_));

        const ssize_t n = inner_->Read(out);
        if (n > 0) {
            remaining_ -= static_cast<std::uint64_t>(n);
            read_ += static_cast<std::uint64_t>(n);
        }
        return n;
    }

    std::optional<std::uint64_t> TotalSize() const override {
        if (!inner_) return std::nullopt;
        auto total = inner_->TotalSize();
        if (!total) return std::nullopt;
        return std::min(*total, read_ + remaining_);
    }

    void Close() { inner_.reset(); }
    bool Closed() const { return inner_ == nullptr; }

    std::uint64_t BytesRead() const { return read_; }

private:
    std::unique_ptr<IReader> inner_;
    std::uint64_t remaining_ = 0;
    std::uint64_t read_ = 0;
};

} // namespace migfetch
