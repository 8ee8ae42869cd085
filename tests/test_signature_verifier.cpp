#include "crypto/signature_verifier.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>

namespace ue {
namespace {

Sha256Digest DigestOf(const std::string& s) {
    return *Sha256(testutil::AsSpan(s));
}

TEST(SignatureVerifierTest, AcceptsSignatureFromTrustedKey) {
    const auto& key = testutil::TrustedTestKey();
    const auto digest = DigestOf("payload bytes");
    const std::string sig = key.Sign(digest);

    PublicKey pub = key.Public();
    EXPECT_TRUE(pub.VerifyPrehashed(digest, testutil::AsSpan(sig)));
}

TEST(SignatureVerifierTest, RejectsOtherDigest) {
    const auto& key = testutil::TrustedTestKey();
    const std::string sig = key.Sign(DigestOf("payload bytes"));

    PublicKey pub = key.Public();
    EXPECT_FALSE(pub.VerifyPrehashed(DigestOf("payload bytez"), testutil::AsSpan(sig)));
}

TEST(SignatureVerifierTest, RejectsSignatureFromUntrustedKey) {
    const auto digest = DigestOf("payload bytes");
    const std::string sig = testutil::UntrustedTestKey().Sign(digest);

    PublicKey pub = testutil::TrustedTestKey().Public();
    EXPECT_FALSE(pub.VerifyPrehashed(digest, testutil::AsSpan(sig)));
}

TEST(SignatureVerifierTest, RejectsEmptyAndTruncatedSignatures) {
    const auto& key = testutil::TrustedTestKey();
    const auto digest = DigestOf("payload bytes");
    const std::string sig = key.Sign(digest);

    PublicKey pub = key.Public();
    EXPECT_FALSE(pub.VerifyPrehashed(digest, {}));
    EXPECT_FALSE(pub.VerifyPrehashed(digest, testutil::AsSpan(sig.substr(0, sig.size() - 1))));
}

TEST(SignatureVerifierTest, KeyRingFindsRotatedKey) {
    TrustedKeyRing ring;
    ring.Add(testutil::UntrustedTestKey().Public("old"));
    ring.Add(testutil::TrustedTestKey().Public("new"));

    const auto digest = DigestOf("rotated");
    const std::string sig = testutil::TrustedTestKey().Sign(digest);

    const PublicKey* key = ring.FindVerifyingKey(digest, testutil::AsSpan(sig));
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(key->Name(), "new");
}

TEST(SignatureVerifierTest, LoadPemRejectsGarbage) {
    PublicKey out;
    auto r = PublicKey::LoadPem("not a key", "garbage", out);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Format);
    EXPECT_FALSE(out.Valid());
}

TEST(SignatureVerifierTest, LoadFromFilesReadsPem) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/key.pem";
    ASSERT_TRUE(testutil::WriteBytesFile(path, testutil::TrustedTestKey().PublicPem()));

    TrustedKeyRing ring;
    auto r = TrustedKeyRing::LoadFromFiles({path}, ring);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(ring.Size(), 1u);
}

TEST(SignatureVerifierTest, LoadFromFilesFailsOnMissingFileOrEmptyList) {
    TrustedKeyRing ring;
    auto missing = TrustedKeyRing::LoadFromFiles({"/nonexistent/key.pem"}, ring);
    ASSERT_FALSE(missing.is_ok());
    EXPECT_EQ(missing.kind, ErrorKind::Io);

    auto empty = TrustedKeyRing::LoadFromFiles({}, ring);
    ASSERT_FALSE(empty.is_ok());
    EXPECT_EQ(empty.kind, ErrorKind::Security);
}

} // namespace
} // namespace ue
