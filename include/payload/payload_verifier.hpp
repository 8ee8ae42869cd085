#pragma once

#include "crypto/sha256.hpp"
#include "crypto/signature_verifier.hpp"
#include "payload/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace ue {

// What the update check pinned for this payload.
struct ExpectedPayload {
    std::optional<std::uint64_t> size;
    std::optional<Sha256Digest> sha256;
};

// Hash and signature checks. Every failure here is a SecurityError except a
// signature block that does not decode (FormatError).
class PayloadVerifier {
  public:
    explicit PayloadVerifier(const TrustedKeyRing& keys) : keys_(&keys) {}

    // Total container length implied by header and manifest. Security error
    // when the manifest carries no signature region.
    static Result DeclaredSize(const PayloadHeader& header, const Manifest& manifest,
                               std::uint64_t& out);

    Result CheckDeclaredSize(const PayloadHeader& header, const Manifest& manifest,
                             const ExpectedPayload& expected) const;

    // |actual| covers every byte before the signature region.
    Result CheckPayloadHash(const Sha256Digest& actual, const ExpectedPayload& expected) const;

    // Succeeds when any signature in |signature_block| verifies against any
    // trusted key. |signed_digest| is the payload hash.
    Result VerifySignatures(const Sha256Digest& signed_digest,
                            std::span<const std::uint8_t> signature_block) const;

    // Version 2 only: signature over SHA-256(header || manifest).
    Result VerifyMetadataSignature(std::span<const std::uint8_t> header_bytes,
                                   std::span<const std::uint8_t> manifest_bytes,
                                   std::span<const std::uint8_t> signature_block) const;

  private:
    Result VerifyAny(const Sha256Digest& digest, std::span<const std::uint8_t> signature_block,
                     const char* what) const;

    const TrustedKeyRing* keys_;
};

} // namespace ue
