#include "testing.hpp"
#include "util/config_parser.hpp"

#include <gtest/gtest.h>
#include <string>

namespace ue {
namespace {

class EngineConfigTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string WriteConfig(const std::string& json) {
        const std::string p = tmp.Path() + "/engine.json";
        EXPECT_TRUE(testutil::WriteBytesFile(p, json));
        return p;
    }
};

TEST_F(EngineConfigTests, DefaultsWhenKeysAbsent) {
    EngineConfig cfg;
    auto r = config::LoadEngineConfigFile(WriteConfig("{}"), cfg);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_TRUE(cfg.trusted_keys.empty());
    EXPECT_EQ(cfg.max_manifest_size, kDefaultMaxManifestSize);
    EXPECT_TRUE(cfg.SupportsMajorVersion(1));
    EXPECT_TRUE(cfg.SupportsMajorVersion(2));
    EXPECT_FALSE(cfg.SupportsMajorVersion(3));
    EXPECT_TRUE(cfg.AllowsOperation(OperationType::kSourceBsdiff));
    EXPECT_EQ(cfg.staging_dir, "/tmp");
    EXPECT_FALSE(cfg.target_capacity_bytes.has_value());
    EXPECT_TRUE(cfg.require_pinned_hash);
    EXPECT_TRUE(cfg.fsync_after_apply);
}

TEST_F(EngineConfigTests, ReadsEveryKey) {
    EngineConfig cfg;
    auto r = config::LoadEngineConfigFile(WriteConfig(R"({
        "TrustedKeys": ["/etc/keys/a.pem", "/etc/keys/b.pem"],
        "MaxManifestSize": 65536,
        "SupportedMajorVersions": [2],
        "AllowedOperations": ["REPLACE", "REPLACE_XZ", "ZERO"],
        "StagingDir": "/var/tmp",
        "MaxOperationBufferBytes": 1048576,
        "TargetCapacityBytes": 8388608,
        "RequirePinnedHash": false,
        "FsyncAfterApply": false
    })"), cfg);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    ASSERT_EQ(cfg.trusted_keys.size(), 2u);
    EXPECT_EQ(cfg.trusted_keys[1], "/etc/keys/b.pem");
    EXPECT_EQ(cfg.max_manifest_size, 65536u);
    EXPECT_FALSE(cfg.SupportsMajorVersion(1));
    EXPECT_TRUE(cfg.SupportsMajorVersion(2));
    EXPECT_TRUE(cfg.AllowsOperation(OperationType::kReplaceXz));
    EXPECT_FALSE(cfg.AllowsOperation(OperationType::kBsdiff));
    EXPECT_EQ(cfg.staging_dir, "/var/tmp");
    EXPECT_EQ(cfg.max_operation_buffer_bytes, 1048576u);
    ASSERT_TRUE(cfg.target_capacity_bytes.has_value());
    EXPECT_EQ(*cfg.target_capacity_bytes, 8388608u);
    EXPECT_FALSE(cfg.require_pinned_hash);
    EXPECT_FALSE(cfg.fsync_after_apply);
}

TEST_F(EngineConfigTests, RejectsWrongTypes) {
    EngineConfig cfg;
    auto r = config::LoadEngineConfigFile(WriteConfig(R"({"MaxManifestSize": "big"})"), cfg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Format);
    EXPECT_NE(r.msg.find("MaxManifestSize"), std::string::npos);
}

TEST_F(EngineConfigTests, RejectsUnknownOperationName) {
    EngineConfig cfg;
    auto r = config::LoadEngineConfigFile(WriteConfig(R"({"AllowedOperations": ["REPLACE", "IMGDIFF"]})"), cfg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("IMGDIFF"), std::string::npos);
}

TEST_F(EngineConfigTests, RejectsUnsupportedMajorVersion) {
    EngineConfig cfg;
    auto r = config::LoadEngineConfigFile(WriteConfig(R"({"SupportedMajorVersions": [1, 3]})"), cfg);
    ASSERT_FALSE(r.is_ok());

    auto empty = config::LoadEngineConfigFile(WriteConfig(R"({"SupportedMajorVersions": []})"), cfg);
    EXPECT_FALSE(empty.is_ok());
}

TEST_F(EngineConfigTests, RejectsZeroManifestLimit) {
    EngineConfig cfg;
    EXPECT_FALSE(config::LoadEngineConfigFile(WriteConfig(R"({"MaxManifestSize": 0})"), cfg).is_ok());
}

TEST_F(EngineConfigTests, RejectsMalformedOrMissingFile) {
    EngineConfig cfg;
    EXPECT_FALSE(config::LoadEngineConfigFile(WriteConfig("{ not json"), cfg).is_ok());
    EXPECT_FALSE(config::LoadEngineConfigFile(WriteConfig("[1, 2]"), cfg).is_ok());
    EXPECT_FALSE(config::LoadEngineConfigFile(tmp.Path() + "/missing.json", cfg).is_ok());
}

} // namespace
} // namespace ue
