#pragma once

#include "io/io.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ue {

using Sha256Digest = std::array<std::uint8_t, 32>;

std::string HexEncode(std::span<const std::uint8_t> bytes);

std::optional<Sha256Digest> Sha256(std::span<const std::uint8_t> data);
std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(IReader& reader);

// Accepts 64 hex characters or the 44-character base64 form used by Omaha.
std::optional<Sha256Digest> ParseSha256(std::string_view text);

// Constant-time comparison.
bool DigestEquals(const Sha256Digest& a, const Sha256Digest& b);

// Incremental digest; Update() may be called any number of times before Final().
class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    std::uint64_t BytesHashed() const;

    // Empty on failure or when already finalized.
    std::optional<Sha256Digest> Final();
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ue
