#pragma once

#include "crypto/sha256.hpp"
#include "crypto/signature_verifier.hpp"
#include "io/io.hpp"
#include "io/staging_file.hpp"
#include "payload/manifest.hpp"
#include "payload/payload_verifier.hpp"
#include "payload/progress.hpp"
#include "util/engine_config.hpp"
#include "util/result.hpp"

#include <atomic>
#include <memory>

namespace ue {

// A payload whose hash and signatures have been checked. Only
// UpdateEngine::Verify() can create one, and Apply() accepts nothing else.
class VerifiedPayload {
  public:
    VerifiedPayload(const VerifiedPayload&) = delete;
    VerifiedPayload& operator=(const VerifiedPayload&) = delete;

    const PayloadHeader& Header() const { return header_; }
    const Manifest& GetManifest() const { return manifest_; }
    const Sha256Digest& PayloadHash() const { return payload_hash_; }

    // False when verification ran without staging the blob.
    bool HasBlob() const { return blob_ != nullptr; }
    const IBlobSource& Blob() const { return *blob_; }

  private:
    friend class UpdateEngine;
    VerifiedPayload() = default;

    PayloadHeader header_{};
    Manifest manifest_;
    Sha256Digest payload_hash_{};
    std::unique_ptr<StagingFile> blob_;
};

struct ApplyOptions {
    IProgress* progress = nullptr;
    const std::atomic_bool* cancel = nullptr;
};

class UpdateEngine {
  public:
    UpdateEngine(const EngineConfig& config, const TrustedKeyRing& keys)
        : config_(&config), keys_(&keys) {}

    // Reads |src| to its end exactly once. With |stage_blob| the data blob is
    // spooled to StagingDir so Apply() can use it; otherwise it is only hashed.
    Result Verify(IReader& src,
                  const ExpectedPayload& expected,
                  bool stage_blob,
                  std::unique_ptr<VerifiedPayload>& out) const;

    // |source| may be null when the payload has no SOURCE_* operations.
    Result Apply(const VerifiedPayload& payload,
                 IBlockDevice& target,
                 IBlockDevice* source,
                 const ApplyOptions& options) const;

  private:
    const EngineConfig* config_;
    const TrustedKeyRing* keys_;
};

} // namespace ue
