#pragma once

#include "crypto/sha256.hpp"
#include "crypto/signature_verifier.hpp"
#include "io/io.hpp"
#include "payload/manifest.hpp"
#include "payload/manifest_decoder.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/update_payload_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

inline std::vector<std::uint8_t> Bytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

inline std::span<const std::uint8_t> AsSpan(const std::string& s) {
    return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

// Sequential reader over a buffer. |max_chunk| limits each Read() the way a pipe would.
class MemoryReader final : public ue::IReader {
  public:
    explicit MemoryReader(std::string data, size_t max_chunk = 0)
        : data_(data.begin(), data.end()), max_chunk_(max_chunk) {}

    explicit MemoryReader(std::vector<std::uint8_t> data, size_t max_chunk = 0)
        : data_(std::move(data)), max_chunk_(max_chunk) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        size_t n = std::min(out.size(), data_.size() - pos_);
        if (max_chunk_ > 0)
            n = std::min(n, max_chunk_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

    size_t Position() const { return pos_; }

  private:
    std::vector<std::uint8_t> data_;
    size_t max_chunk_ = 0;
    size_t pos_ = 0;
};

inline std::string ReadAll(ue::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

// In-memory slot device that records every mutation in order.
class MemoryDevice final : public ue::IBlockDevice {
  public:
    struct WriteRecord {
        std::uint64_t offset = 0;
        std::uint64_t length = 0;
        bool discard = false;
    };

    explicit MemoryDevice(std::uint64_t capacity, std::uint8_t fill = 0)
        : data_(static_cast<size_t>(capacity), fill) {}

    std::uint64_t Capacity() const override { return data_.size(); }

    ue::Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) override {
        if (offset > data_.size() || out.size() > data_.size() - offset)
            return ue::Result::OutOfBounds("read past end of memory device");
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset), out.size(), out.begin());
        return ue::Result::Ok();
    }

    ue::Result WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) override {
        if (offset > data_.size() || in.size() > data_.size() - offset)
            return ue::Result::OutOfBounds("write past end of memory device");
        std::copy(in.begin(), in.end(), data_.begin() + static_cast<std::ptrdiff_t>(offset));
        log_.push_back({offset, in.size(), false});
        return ue::Result::Ok();
    }

    ue::Result Discard(std::uint64_t offset, std::uint64_t length) override {
        if (offset > data_.size() || length > data_.size() - offset)
            return ue::Result::OutOfBounds("discard past end of memory device");
        std::fill_n(data_.begin() + static_cast<std::ptrdiff_t>(offset), length, 0);
        log_.push_back({offset, length, true});
        return ue::Result::Ok();
    }

    ue::Result FsyncNow() override {
        ++fsyncs_;
        return ue::Result::Ok();
    }

    std::vector<std::uint8_t>& Data() { return data_; }
    const std::vector<std::uint8_t>& Data() const { return data_; }
    const std::vector<WriteRecord>& Log() const { return log_; }
    int Fsyncs() const { return fsyncs_; }

    std::uint64_t BytesWritten() const {
        std::uint64_t total = 0;
        for (const auto& w : log_)
            if (!w.discard)
                total += w.length;
        return total;
    }

    bool RangeIs(std::uint64_t offset, std::uint64_t length, std::uint8_t value) const {
        return std::all_of(data_.begin() + static_cast<std::ptrdiff_t>(offset),
                           data_.begin() + static_cast<std::ptrdiff_t>(offset + length),
                           [value](std::uint8_t b) { return b == value; });
    }

  private:
    std::vector<std::uint8_t> data_;
    std::vector<WriteRecord> log_;
    int fsyncs_ = 0;
};

class MemoryBlob final : public ue::IBlobSource {
  public:
    explicit MemoryBlob(std::string data) : data_(std::move(data)) {}

    std::uint64_t Size() const override { return data_.size(); }

    ue::Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const override {
        if (offset > data_.size() || out.size() > data_.size() - offset)
            return ue::Result::OutOfBounds("read past end of blob");
        std::memcpy(out.data(), data_.data() + offset, out.size());
        return ue::Result::Ok();
    }

  private:
    std::string data_;
};

enum class Compression { kBzip2, kXz };

// Compresses |data| with libarchive's raw writer and the requested filter.
inline std::string Compress(const std::string& data, Compression c) {
    std::vector<std::uint8_t> out(data.size() * 2 + 64 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    const int fr = c == Compression::kBzip2 ? archive_write_add_filter_bzip2(a)
                                            : archive_write_add_filter_xz(a);
    if (fr != ARCHIVE_OK || archive_write_set_format_raw(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("cannot configure libarchive compressor");
    }
    archive_write_set_bytes_in_last_block(a, 1);
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    archive_entry* hdr = archive_entry_new();
    archive_entry_set_pathname(hdr, "data");
    archive_entry_set_filetype(hdr, AE_IFREG);
    archive_entry_set_size(hdr, static_cast<la_int64_t>(data.size()));
    if (archive_write_header(a, hdr) != ARCHIVE_OK) {
        archive_entry_free(hdr);
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_header failed");
    }
    if (!data.empty() && archive_write_data(a, data.data(), data.size()) < 0) {
        archive_entry_free(hdr);
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_data failed");
    }
    archive_entry_free(hdr);

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    (void)archive_write_free(a);
    return std::string(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(used));
}

inline bool WriteBytesFile(const std::string& path, const std::string& content) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good())
        return false;
    os.write(content.data(), static_cast<std::streamsize>(content.size()));
    return os.good();
}

inline std::string ReadFileBytes(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

inline std::string DigestBytes(const ue::Sha256Digest& d) {
    return std::string(reinterpret_cast<const char*>(d.data()), d.size());
}

inline std::string Sha256Raw(const std::string& data) {
    auto d = ue::Sha256(AsSpan(data));
    if (!d)
        throw std::runtime_error("sha256 failed");
    return DigestBytes(*d);
}

// RSA-2048 signing key for fixtures.
class TestKey {
  public:
    TestKey() {
        EVP_PKEY* k = EVP_RSA_gen(2048);
        if (!k)
            throw std::runtime_error("EVP_RSA_gen failed");
        key_.reset(k, &EVP_PKEY_free);
    }

    std::string Sign(const ue::Sha256Digest& digest) const {
        std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
            EVP_PKEY_CTX_new(key_.get(), nullptr), &EVP_PKEY_CTX_free);
        if (!ctx || EVP_PKEY_sign_init(ctx.get()) != 1 ||
            EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) != 1 ||
            EVP_PKEY_CTX_set_signature_md(ctx.get(), EVP_sha256()) != 1) {
            throw std::runtime_error("cannot set up signing");
        }
        size_t len = 0;
        if (EVP_PKEY_sign(ctx.get(), nullptr, &len, digest.data(), digest.size()) != 1)
            throw std::runtime_error("EVP_PKEY_sign size query failed");
        std::string sig(len, '\0');
        if (EVP_PKEY_sign(ctx.get(), reinterpret_cast<unsigned char*>(sig.data()), &len,
                          digest.data(), digest.size()) != 1)
            throw std::runtime_error("EVP_PKEY_sign failed");
        sig.resize(len);
        return sig;
    }

    std::string PublicPem() const {
        std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), &BIO_free);
        if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1)
            throw std::runtime_error("PEM_write_bio_PUBKEY failed");
        char* data = nullptr;
        const long n = BIO_get_mem_data(bio.get(), &data);
        return std::string(data, static_cast<size_t>(n));
    }

    ue::PublicKey Public(const std::string& name = "test-key") const {
        ue::PublicKey out;
        auto r = ue::PublicKey::LoadPem(PublicPem(), name, out);
        if (!r.is_ok())
            throw std::runtime_error(r.msg);
        return out;
    }

  private:
    std::shared_ptr<EVP_PKEY> key_;
};

// Key generation is slow; fixtures share two process-wide keys.
inline const TestKey& TrustedTestKey() {
    static const TestKey key;
    return key;
}

inline const TestKey& UntrustedTestKey() {
    static const TestKey key;
    return key;
}

inline ue::TrustedKeyRing RingOf(const TestKey& key) {
    ue::TrustedKeyRing ring;
    ring.Add(key.Public("trusted"));
    return ring;
}

inline ue::Extent Ext(std::uint64_t start, std::uint64_t num) {
    return ue::Extent{.start_block = start, .num_blocks = num};
}

inline ue::InstallOperation Op(ue::OperationType type,
                               std::vector<ue::Extent> dst,
                               std::vector<ue::Extent> src = {}) {
    ue::InstallOperation op;
    op.type = type;
    op.dst_extents = std::move(dst);
    op.src_extents = std::move(src);
    return op;
}

// bsdiff integer encoding: little-endian magnitude, sign in the top bit.
inline std::string Offtin(std::int64_t v) {
    std::uint64_t mag = v < 0 ? static_cast<std::uint64_t>(-v) : static_cast<std::uint64_t>(v);
    std::string out(8, '\0');
    for (size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<char>(mag & 0xFF);
        mag >>= 8;
    }
    if (v < 0)
        out[7] = static_cast<char>(out[7] | 0x80);
    return out;
}

struct BsdiffControl {
    std::int64_t add;
    std::int64_t copy;
    std::int64_t seek;
};

inline std::string BsdiffControlStream(const std::vector<BsdiffControl>& entries) {
    std::string out;
    for (const auto& c : entries)
        out += Offtin(c.add) + Offtin(c.copy) + Offtin(c.seek);
    return out;
}

// BSDF2 patch with all three streams bzip2-compressed, the layout
// delta_generator emits.
inline std::string BsdiffPatch(const std::vector<BsdiffControl>& ctrl,
                               const std::string& diff,
                               const std::string& extra,
                               std::int64_t new_size) {
    const std::string c = Compress(BsdiffControlStream(ctrl), Compression::kBzip2);
    const std::string d = Compress(diff, Compression::kBzip2);
    const std::string e = Compress(extra, Compression::kBzip2);
    std::string patch = std::string("BSDF2") + '\x01' + '\x01' + '\x01';
    patch += Offtin(static_cast<std::int64_t>(c.size()));
    patch += Offtin(static_cast<std::int64_t>(d.size()));
    patch += Offtin(new_size);
    return patch + c + d + e;
}

// Assembles a complete payload: header, manifest, optional metadata
// signature, blob and signature block signed over the payload hash.
class PayloadBuilder {
  public:
    PayloadBuilder() { manifest_.block_size = ue::kDefaultBlockSize; }

    PayloadBuilder& MajorVersion(std::uint64_t v) {
        major_version_ = v;
        return *this;
    }

    PayloadBuilder& BlockSize(std::uint32_t bs) {
        manifest_.block_size = bs;
        return *this;
    }

    // Appends |data| to the blob and points |op| at it.
    PayloadBuilder& Add(ue::InstallOperation op, const std::string& data = {}, bool with_hash = true) {
        if (!data.empty()) {
            op.data_offset = blob_.size();
            op.data_length = data.size();
            blob_ += data;
            if (with_hash)
                op.data_sha256_hash = Sha256Raw(data);
        }
        manifest_.install_operations.push_back(std::move(op));
        return *this;
    }

    PayloadBuilder& SignWith(const TestKey& key) {
        signers_.push_back(&key);
        return *this;
    }

    PayloadBuilder& Unsigned() {
        unsigned_ = true;
        return *this;
    }

    // Applied to the manifest right before it is encoded.
    PayloadBuilder& Mutate(std::function<void(ue::Manifest&)> fn) {
        mutate_ = std::move(fn);
        return *this;
    }

    ue::Manifest& Manifest() { return manifest_; }

    std::string Build() {
        ue::Manifest m = manifest_;
        if (!unsigned_) {
            m.signatures_offset = blob_.size();
            m.signatures_size = SignatureBlock(ue::Sha256Digest{}).size();
        }
        if (mutate_)
            mutate_(m);
        const std::string manifest = ue::EncodeManifest(m);

        std::string header(ue::kPayloadMagic, sizeof(ue::kPayloadMagic));
        AppendBe(header, major_version_, 8);
        AppendBe(header, manifest.size(), 8);

        std::string metadata_sig;
        if (major_version_ >= 2) {
            const std::uint64_t sig_size = SignatureBlock(ue::Sha256Digest{}).size();
            AppendBe(header, sig_size, 4);
            auto digest = ue::Sha256(AsSpan(header + manifest));
            metadata_sig = SignatureBlock(*digest);
        }

        std::string out = header + manifest + metadata_sig + blob_;
        auto digest = ue::Sha256(AsSpan(out));
        payload_hash_ = *digest;
        if (!unsigned_)
            out += SignatureBlock(*digest);
        return out;
    }

    // Hash of every byte before the signature block; valid after Build().
    const ue::Sha256Digest& PayloadHash() const { return payload_hash_; }
    const std::string& Blob() const { return blob_; }

  private:
    static void AppendBe(std::string& out, std::uint64_t v, int bytes) {
        for (int i = bytes - 1; i >= 0; --i)
            out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }

    std::string SignatureBlock(const ue::Sha256Digest& digest) const {
        std::vector<ue::Signature> sigs;
        for (const TestKey* key : signers_) {
            ue::Signature s;
            s.version = 2;
            s.data = key->Sign(digest);
            sigs.push_back(std::move(s));
        }
        return ue::EncodeSignatures(sigs);
    }

    std::uint64_t major_version_ = 1;
    ue::Manifest manifest_;
    std::string blob_;
    std::vector<const TestKey*> signers_;
    bool unsigned_ = false;
    std::function<void(ue::Manifest&)> mutate_;
    ue::Sha256Digest payload_hash_{};
};

} // namespace testutil
