#pragma once

#include "crypto/sha256.hpp"
#include "util/result.hpp"

#include <openssl/types.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ue {

// A trusted verification key (PEM SubjectPublicKeyInfo, RSA or EC).
class PublicKey {
public:
    static Result LoadPem(std::string_view pem, std::string name, PublicKey& out);
    static Result LoadPemFile(const std::string& path, PublicKey& out);

    const std::string& Name() const { return name_; }
    bool Valid() const { return key_ != nullptr; }

    // Checks |signature| over an already computed SHA-256 digest. RSA keys use
    // PKCS#1 v1.5 padding with a SHA-256 DigestInfo.
    bool VerifyPrehashed(const Sha256Digest& digest, std::span<const std::uint8_t> signature) const;

private:
    std::string name_;
    std::shared_ptr<EVP_PKEY> key_;
};

class TrustedKeyRing {
public:
    static Result LoadFromFiles(const std::vector<std::string>& paths, TrustedKeyRing& out);

    void Add(PublicKey key) { keys_.push_back(std::move(key)); }
    std::size_t Size() const { return keys_.size(); }
    bool Empty() const { return keys_.empty(); }

    // First key that accepts |signature|, or nullptr.
    const PublicKey* FindVerifyingKey(const Sha256Digest& digest,
                                      std::span<const std::uint8_t> signature) const;

private:
    std::vector<PublicKey> keys_;
};

} // namespace ue
