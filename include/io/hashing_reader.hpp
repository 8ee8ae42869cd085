#pragma once
#include "crypto/sha256.hpp"
#include "io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace ue {

// Tee over a sequential source: every byte handed to the caller is also fed
// to a SHA-256 accumulator, up to an optional limit set once the caller knows
// where the hashed region ends.
class HashingReader final : public IReader {
public:
    explicit HashingReader(IReader& inner) : inner_(&inner) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        const ssize_t n = inner_->Read(out);
        if (n > 0) {
            const auto got = static_cast<std::uint64_t>(n);
            if (read_ < limit_) {
                const auto take = std::min<std::uint64_t>(got, limit_ - read_);
                hasher_.Update(std::span<const std::uint8_t>(out.data(), static_cast<size_t>(take)));
            }
            read_ += got;
        }
        return n;
    }

    std::optional<std::uint64_t> TotalSize() const override { return inner_->TotalSize(); }

    // Must not be lower than the bytes already consumed.
    void SetHashLimit(std::uint64_t limit) { limit_ = std::max(limit, hasher_.BytesHashed()); }

    std::uint64_t BytesRead() const { return read_; }
    std::uint64_t BytesHashed() const { return hasher_.BytesHashed(); }

    std::optional<Sha256Digest> FinishHash() { return hasher_.Final(); }

private:
    IReader* inner_ = nullptr;
    Sha256Hasher hasher_;
    std::uint64_t read_ = 0;
    std::uint64_t limit_ = std::numeric_limits<std::uint64_t>::max();
};

} // namespace ue
