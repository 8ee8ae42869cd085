#include "crypto/sha256.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace ue {

namespace {

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

bool InitSha256(EvpCtx& ctx) {
    return ctx.ok() && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1;
}

bool UpdateSha256(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

bool FinalSha256(EvpCtx& ctx, Sha256Digest& out) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) return false;
    return len == out.size();
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Sha256Digest> ParseHex(std::string_view text) {
    Sha256Digest out{};
    for (size_t i = 0; i < out.size(); ++i) {
        const int hi = HexValue(text[i * 2]);
        const int lo = HexValue(text[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::optional<Sha256Digest> ParseBase64(std::string_view text) {
    // 32 bytes encode to 44 characters with one '=' of padding.
    if (text.back() != '=' || text[text.size() - 2] == '=') return std::nullopt;

    std::array<unsigned char, 33> decoded{};
    const int n = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    // EVP_DecodeBlock does not strip padding from its length.
    if (n != 33) return std::nullopt;

    Sha256Digest out{};
    std::copy_n(decoded.begin(), out.size(), out.begin());
    return out;
}

} // namespace

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

struct Sha256Hasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool finalized = false;
    std::uint64_t bytes = 0;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    if (impl_ && InitSha256(impl_->ctx)) {
        impl_->initialized = true;
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->initialized || impl_->finalized) return;
    if (!UpdateSha256(impl_->ctx, data)) {
        // A failed update poisons the digest; Final() then reports failure.
        impl_->initialized = false;
        return;
    }
    impl_->bytes += data.size();
}

std::uint64_t Sha256Hasher::BytesHashed() const { return impl_ ? impl_->bytes : 0; }

std::optional<Sha256Digest> Sha256Hasher::Final() {
    if (!impl_ || !impl_->initialized || impl_->finalized) return std::nullopt;
    impl_->finalized = true;
    Sha256Digest digest{};
    if (!FinalSha256(impl_->ctx, digest)) return std::nullopt;
    return digest;
}

std::string Sha256Hasher::FinalHex() {
    auto digest = Final();
    if (!digest) return {};
    return HexEncode(*digest);
}

std::optional<Sha256Digest> Sha256(std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!InitSha256(ctx)) return std::nullopt;
    if (!UpdateSha256(ctx, data)) return std::nullopt;
    Sha256Digest digest{};
    if (!FinalSha256(ctx, digest)) return std::nullopt;
    return digest;
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    auto digest = Sha256(data);
    if (!digest) return {};
    return HexEncode(*digest);
}

std::string Sha256Hex(IReader& reader) {
    Sha256Hasher hasher;

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }

    return hasher.FinalHex();
}

std::optional<Sha256Digest> ParseSha256(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    if (text.size() == 64) return ParseHex(text);
    if (text.size() == 44) return ParseBase64(text);
    return std::nullopt;
}

bool DigestEquals(const Sha256Digest& a, const Sha256Digest& b) {
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace ue
