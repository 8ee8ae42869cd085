#include "payload/payload_verifier.hpp"

#include "payload/manifest_decoder.hpp"
#include "util/logger.hpp"

#include <string>

namespace ue {

Result PayloadVerifier::DeclaredSize(const PayloadHeader& header, const Manifest& manifest,
                                     std::uint64_t& out) {
    if (!manifest.signatures_offset || !manifest.signatures_size) {
        return Result::SecurityError("Payload is unsigned");
    }
    std::uint64_t total = 0;
    if (__builtin_add_overflow(header.MetadataSize(), *manifest.signatures_offset, &total) ||
        __builtin_add_overflow(total, *manifest.signatures_size, &total)) {
        return Result::FormatError("Declared payload size overflows");
    }
    out = total;
    return Result::Ok();
}

Result PayloadVerifier::CheckDeclaredSize(const PayloadHeader& header, const Manifest& manifest,
                                          const ExpectedPayload& expected) const {
    std::uint64_t declared = 0;
    Result r = DeclaredSize(header, manifest, declared);
    if (!r.is_ok()) return r;

    if (expected.size && *expected.size != declared) {
        return Result::SecurityError("Payload size mismatch: expected " +
                                     std::to_string(*expected.size) + ", manifest declares " +
                                     std::to_string(declared));
    }
    return Result::Ok();
}

Result PayloadVerifier::CheckPayloadHash(const Sha256Digest& actual,
                                         const ExpectedPayload& expected) const {
    if (!expected.sha256) {
        return Result::Ok();
    }
    if (!DigestEquals(actual, *expected.sha256)) {
        return Result::SecurityError("Payload hash mismatch: expected " +
                                     HexEncode(*expected.sha256) + " actual " + HexEncode(actual));
    }
    LogDebug("Payload hash matches %s", HexEncode(actual).c_str());
    return Result::Ok();
}

Result PayloadVerifier::VerifyAny(const Sha256Digest& digest,
                                  std::span<const std::uint8_t> signature_block,
                                  const char* what) const {
    auto signatures = DecodeSignatures(signature_block);
    if (!signatures) {
        return Result::FormatError(std::string(what) + ": " + signatures.error());
    }
    if (signatures->empty()) {
        return Result::SecurityError(std::string(what) + ": no signatures present");
    }

    for (size_t i = 0; i < signatures->size(); ++i) {
        const Signature& sig = (*signatures)[i];
        if (sig.data.empty()) {
            LogInfo("%s %zu carries no data, skipping", what, i);
            continue;
        }

        size_t len = sig.data.size();
        if (sig.unpadded_signature_size && *sig.unpadded_signature_size < len) {
            len = *sig.unpadded_signature_size;
        }
        const auto bytes =
            std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(sig.data.data()), len);

        if (const PublicKey* key = keys_->FindVerifyingKey(digest, bytes)) {
            LogInfo("%s %zu (version %u) verified with key %s", what, i, sig.version,
                    key->Name().c_str());
            return Result::Ok();
        }
        LogInfo("%s %zu (version %u) matches no trusted key", what, i, sig.version);
    }

    return Result::SecurityError(std::string(what) + ": no signature verifies against a trusted key");
}

Result PayloadVerifier::VerifySignatures(const Sha256Digest& signed_digest,
                                         std::span<const std::uint8_t> signature_block) const {
    return VerifyAny(signed_digest, signature_block, "Payload signature");
}

Result PayloadVerifier::VerifyMetadataSignature(std::span<const std::uint8_t> header_bytes,
                                                std::span<const std::uint8_t> manifest_bytes,
                                                std::span<const std::uint8_t> signature_block) const {
    if (signature_block.empty()) {
        return Result::SecurityError("Metadata signature missing");
    }

    Sha256Hasher hasher;
    hasher.Update(header_bytes);
    hasher.Update(manifest_bytes);
    auto digest = hasher.Final();
    if (!digest) {
        return Result::Fail(ErrorKind::Io, "SHA-256 of metadata failed");
    }
    return VerifyAny(*digest, signature_block, "Metadata signature");
}

} // namespace ue
