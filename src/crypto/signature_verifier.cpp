#include "crypto/signature_verifier.hpp"

#include "util/logger.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <cerrno>
#include <fstream>
#include <sstream>

namespace ue {

namespace {

std::string TakeOpenSslError() {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) return "unknown error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

} // namespace

Result PublicKey::LoadPem(std::string_view pem, std::string name, PublicKey& out) {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
    if (!bio) {
        return Result::Fail(ErrorKind::Io, "BIO_new_mem_buf failed");
    }

    EVP_PKEY* raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (!raw) {
        return Result::FormatError("Not a PEM public key: " + name + " (" + TakeOpenSslError() + ")");
    }

    const int id = EVP_PKEY_get_base_id(raw);
    if (id != EVP_PKEY_RSA && id != EVP_PKEY_EC) {
        EVP_PKEY_free(raw);
        return Result::FormatError("Unsupported key type in " + name);
    }

    out.name_ = std::move(name);
    out.key_.reset(raw, &EVP_PKEY_free);
    return Result::Ok();
}

Result PublicKey::LoadPemFile(const std::string& path, PublicKey& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return Result::IoError(ENOENT, "Cannot open key file: " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    return LoadPem(ss.str(), path, out);
}

bool PublicKey::VerifyPrehashed(const Sha256Digest& digest,
                                std::span<const std::uint8_t> signature) const {
    if (!key_ || signature.empty()) return false;

    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new(key_.get(), nullptr), &EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_verify_init(ctx.get()) != 1) {
        LogWarn("EVP_PKEY_verify_init failed: %s", TakeOpenSslError().c_str());
        return false;
    }
    if (EVP_PKEY_get_base_id(key_.get()) == EVP_PKEY_RSA &&
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) != 1) {
        LogWarn("Cannot select RSA PKCS#1 padding: %s", TakeOpenSslError().c_str());
        return false;
    }
    if (EVP_PKEY_CTX_set_signature_md(ctx.get(), EVP_sha256()) != 1) {
        LogWarn("Cannot select SHA-256 signature digest: %s", TakeOpenSslError().c_str());
        return false;
    }

    const int rc = EVP_PKEY_verify(ctx.get(), signature.data(), signature.size(), digest.data(),
                                   digest.size());
    // A mismatch leaves an entry on the error queue.
    ERR_clear_error();
    return rc == 1;
}

Result TrustedKeyRing::LoadFromFiles(const std::vector<std::string>& paths, TrustedKeyRing& out) {
    TrustedKeyRing ring;
    for (const auto& path : paths) {
        PublicKey key;
        Result r = PublicKey::LoadPemFile(path, key);
        if (!r.is_ok()) {
            return r;
        }
        LogDebug("Trusted key loaded: %s", path.c_str());
        ring.Add(std::move(key));
    }
    if (ring.Empty()) {
        return Result::SecurityError("No trusted keys configured");
    }
    out = std::move(ring);
    return Result::Ok();
}

const PublicKey* TrustedKeyRing::FindVerifyingKey(const Sha256Digest& digest,
                                                  std::span<const std::uint8_t> signature) const {
    for (const auto& key : keys_) {
        if (key.VerifyPrehashed(digest, signature)) {
            return &key;
        }
    }
    return nullptr;
}

} // namespace ue
