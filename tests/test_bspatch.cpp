#include "payload/bspatch.hpp"
#include "testing.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>

namespace ue {
namespace {

class CollectingWriter final : public IWriter {
  public:
    Result WriteAll(std::span<const std::uint8_t> in) override {
        data.append(reinterpret_cast<const char*>(in.data()), in.size());
        return Result::Ok();
    }
    Result FsyncNow() override { return Result::Ok(); }

    std::string data;
};

std::string Patch(const std::string& old_data, const std::string& patch, Result& r) {
    CollectingWriter out;
    r = ApplyBsdiffPatch(testutil::AsSpan(old_data), testutil::AsSpan(patch), out);
    return out.data;
}

TEST(BspatchTest, AddsDiffToOldAndCopiesExtra) {
    const std::string diff = {1, 1, 0, 0};
    const std::string patch = testutil::BsdiffPatch({{4, 3, 0}}, diff, "XYZ", 7);

    Result r;
    EXPECT_EQ(Patch("abcdefgh", patch, r), "bccdXYZ");
    EXPECT_TRUE(r.is_ok()) << r.msg;
}

TEST(BspatchTest, NegativeSeekRereadsOldData) {
    const std::string diff(4, '\0');
    const std::string patch = testutil::BsdiffPatch({{2, 0, -2}, {2, 1, 0}}, diff, "!", 5);

    Result r;
    EXPECT_EQ(Patch("abcdefgh", patch, r), "abab!");
    EXPECT_TRUE(r.is_ok()) << r.msg;
}

TEST(BspatchTest, DiffPastOldDataAddsToZero) {
    const std::string diff = {'y', 'z'};
    const std::string patch = testutil::BsdiffPatch({{2, 0, 0}}, diff, "", 2);

    Result r;
    EXPECT_EQ(Patch("", patch, r), "yz");
    EXPECT_TRUE(r.is_ok()) << r.msg;
}

TEST(BspatchTest, ReadsLegacyBzip2Patch) {
    const std::string ctrl = testutil::BsdiffControlStream({{3, 4, 0}});
    const std::string diff(3, '\0');
    const std::string extra = "tail";

    const std::string c = testutil::Compress(ctrl, testutil::Compression::kBzip2);
    const std::string d = testutil::Compress(diff, testutil::Compression::kBzip2);
    const std::string e = testutil::Compress(extra, testutil::Compression::kBzip2);

    std::string patch = "BSDIFF40";
    patch += testutil::Offtin(static_cast<std::int64_t>(c.size()));
    patch += testutil::Offtin(static_cast<std::int64_t>(d.size()));
    patch += testutil::Offtin(7);
    patch += c + d + e;

    Result r;
    EXPECT_EQ(Patch("old", patch, r), "oldtail");
    EXPECT_TRUE(r.is_ok()) << r.msg;
}

TEST(BspatchTest, RejectsBadMagic) {
    std::string patch = testutil::BsdiffPatch({{1, 0, 0}}, std::string(1, '\0'), "", 1);
    patch[0] = 'X';
    Result r;
    Patch("a", patch, r);
    EXPECT_EQ(r.kind, ErrorKind::Format);

    auto size = BsdiffNewSize(testutil::AsSpan(patch));
    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error(), "Bad bsdiff magic");
}

TEST(BspatchTest, ReadsDeclaredNewSizeFromHeader) {
    const std::string patch = testutil::BsdiffPatch({{3, 0, 0}}, std::string(3, '\0'), "", 3);
    auto size = BsdiffNewSize(testutil::AsSpan(patch));
    ASSERT_TRUE(size.has_value()) << size.error();
    EXPECT_EQ(*size, 3u);

    EXPECT_FALSE(BsdiffNewSize(testutil::AsSpan(patch.substr(0, 20))).has_value());

    std::string negative = patch;
    negative[31] = static_cast<char>(negative[31] | 0x80);
    EXPECT_FALSE(BsdiffNewSize(testutil::AsSpan(negative)).has_value());
}

TEST(BspatchTest, SeekNearInt64MaxDoesNotWrapOldPosition) {
    const std::int64_t far = std::numeric_limits<std::int64_t>::max() - 2;
    const std::string diff = "01234567";
    const std::string patch = testutil::BsdiffPatch({{0, 0, far}, {8, 0, 0}}, diff, "", 8);

    Result r;
    const std::string out = Patch("abcdefgh", patch, r);
    if (r.is_ok()) {
        // Nothing of the old data is in range, so the diff goes through unchanged.
        EXPECT_EQ(out, diff);
    } else {
        EXPECT_EQ(r.kind, ErrorKind::Format);
    }
}

TEST(BspatchTest, WriteFailureKeepsWriterError) {
    class FailingWriter final : public IWriter {
      public:
        Result WriteAll(std::span<const std::uint8_t>) override {
            return Result::IoError(EIO, "disk gone");
        }
        Result FsyncNow() override { return Result::Ok(); }
    } out;

    const std::string patch = testutil::BsdiffPatch({{0, 4, 0}}, "", "data", 4);
    const std::string old_data = "old";
    Result r = ApplyBsdiffPatch(testutil::AsSpan(old_data), testutil::AsSpan(patch), out);
    EXPECT_EQ(r.kind, ErrorKind::Io);
}

TEST(BspatchTest, RejectsControlEntryPastNewSize) {
    const std::string patch = testutil::BsdiffPatch({{4, 0, 0}}, std::string(4, '\0'), "", 3);
    Result r;
    Patch("abcd", patch, r);
    EXPECT_EQ(r.kind, ErrorKind::Format);
}

TEST(BspatchTest, RejectsTruncatedStreams) {
    const std::string patch = testutil::BsdiffPatch({{4, 0, 0}}, std::string(2, '\0'), "", 4);
    Result r;
    Patch("abcd", patch, r);
    EXPECT_EQ(r.kind, ErrorKind::Format);

    const std::string short_patch = "BSDF2";
    Patch("abcd", short_patch, r);
    EXPECT_EQ(r.kind, ErrorKind::Format);
}

TEST(BspatchTest, RejectsUnknownStreamCompression) {
    std::string patch = testutil::BsdiffPatch({{1, 0, 0}}, std::string(1, '\0'), "", 1);
    patch[6] = 5;
    Result r;
    Patch("a", patch, r);
    EXPECT_EQ(r.kind, ErrorKind::Format);
}

} // namespace
} // namespace ue
