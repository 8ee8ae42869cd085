#include "crypto/sha256.hpp"
#include "crypto/signature_verifier.hpp"
#include "io/file_reader.hpp"
#include "io/partition_device.hpp"
#include "payload/update_engine.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/progress_sinks.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace {

constexpr int kExitUsage = 2;

enum LongOnly : int {
    kOptVerifyOnly = 256,
    kOptExpectedSize,
    kOptExpectedSha256,
    kOptMaxManifestSize,
    kOptProgressFile,
    kOptLogLevel,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] <payload|->\n"
        "\n"
        "Options:\n"
        "  -c, --config <path>          Engine config (default %s)\n"
        "  -k, --key <pem>              Trusted public key; repeatable, adds to config keys\n"
        "  -t, --target <path>          Inactive slot device or image file to update\n"
        "  -s, --source <path>          Active slot, read by SOURCE_* operations\n"
        "      --verify-only            Verify hash and signatures, write nothing\n"
        "      --expected-size <bytes>  Payload size from the update check\n"
        "      --expected-sha256 <h>    Payload SHA-256 from the update check (hex or base64)\n"
        "      --max-manifest-size <n>  Override MaxManifestSize\n"
        "      --progress-file <path>   Write JSON progress to this file\n"
        "      --log-level <level>      debug, info, warn, error or none\n"
        "  -v, --verbose                Same as --log-level debug\n"
        "  -q, --quiet                  Errors only, no progress line\n"
        "  -h, --help                   Show this help\n"
        "\n"
        "Exit codes: 0 ok, 2 usage/config, 3 format, 4 security, 5 integrity,\n"
        "            6 out of bounds, 7 I/O, 130 cancelled\n",
        argv, ue::config::kDefaultConfigPath);
}

int ExitCodeFor(ue::ErrorKind kind) {
    switch (kind) {
        case ue::ErrorKind::None:        return 0;
        case ue::ErrorKind::Format:      return 3;
        case ue::ErrorKind::Security:    return 4;
        case ue::ErrorKind::Integrity:   return 5;
        case ue::ErrorKind::OutOfBounds: return 6;
        case ue::ErrorKind::Io:          return 7;
        case ue::ErrorKind::Cancelled:   return 130;
    }
    return 1;
}

int Fail(const ue::Result &r) {
    ue::ClearProgressLine();
    std::fprintf(stderr, "ERROR: %s: %s\n", ue::ErrorKindName(r.kind), r.msg.c_str());
    return ExitCodeFor(r.kind);
}

bool ParseU64(const char *s, std::uint64_t &out) {
    if (!s || *s == '\0' || *s == '-') return false;
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool FileExists(const std::string &path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace

int main(int argc, char **argv) {
    ue::InstallSignalHandlers();

    std::optional<std::string> config_cli;
    std::vector<std::string> keys_cli;
    std::optional<std::string> target_path;
    std::optional<std::string> source_path;
    std::optional<std::string> progress_file;
    std::optional<std::uint64_t> max_manifest_cli;
    bool verify_only = false;
    bool quiet = false;
    ue::ExpectedPayload expected;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"key", required_argument, nullptr, 'k'},
        {"target", required_argument, nullptr, 't'},
        {"source", required_argument, nullptr, 's'},
        {"verify-only", no_argument, nullptr, kOptVerifyOnly},
        {"expected-size", required_argument, nullptr, kOptExpectedSize},
        {"expected-sha256", required_argument, nullptr, kOptExpectedSha256},
        {"max-manifest-size", required_argument, nullptr, kOptMaxManifestSize},
        {"progress-file", required_argument, nullptr, kOptProgressFile},
        {"log-level", required_argument, nullptr, kOptLogLevel},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:k:t:s:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_cli = optarg;
                break;

            case 'k':
                keys_cli.emplace_back(optarg);
                break;

            case 't':
                target_path = optarg;
                break;

            case 's':
                source_path = optarg;
                break;

            case kOptVerifyOnly:
                verify_only = true;
                break;

            case kOptExpectedSize: {
                std::uint64_t v = 0;
                if (!ParseU64(optarg, v)) {
                    std::fprintf(stderr, "Invalid --expected-size: %s\n", optarg);
                    return kExitUsage;
                }
                expected.size = v;
                break;
            }

            case kOptExpectedSha256: {
                auto digest = ue::ParseSha256(optarg);
                if (!digest) {
                    std::fprintf(stderr, "Invalid --expected-sha256: %s\n", optarg);
                    return kExitUsage;
                }
                expected.sha256 = *digest;
                break;
            }

            case kOptMaxManifestSize: {
                std::uint64_t v = 0;
                if (!ParseU64(optarg, v) || v == 0) {
                    std::fprintf(stderr, "Invalid --max-manifest-size: %s\n", optarg);
                    return kExitUsage;
                }
                max_manifest_cli = v;
                break;
            }

            case kOptProgressFile:
                progress_file = optarg;
                break;

            case kOptLogLevel: {
                auto lvl = ue::ParseLogLevel(optarg);
                if (!lvl) {
                    std::fprintf(stderr, "Invalid --log-level: %s\n", optarg);
                    return kExitUsage;
                }
                ue::Logger::Instance().SetLevel(*lvl);
                break;
            }

            case 'v':
                ue::Logger::Instance().SetLevel(ue::LogLevel::Debug);
                break;

            case 'q':
                quiet = true;
                ue::Logger::Instance().SetLevel(ue::LogLevel::Error);
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind != argc - 1) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    const std::string payload_path = argv[optind];

    if (!verify_only && !target_path) {
        std::fprintf(stderr, "ERROR: --target is required unless --verify-only is given\n");
        return kExitUsage;
    }

    ue::EngineConfig cfg;
    const std::string config_path = config_cli.value_or(ue::config::kDefaultConfigPath);
    if (config_cli || FileExists(config_path)) {
        if (auto r = ue::config::LoadEngineConfigFile(config_path, cfg); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitUsage;
        }
    } else if (keys_cli.empty()) {
        std::fprintf(stderr, "ERROR: cannot load config: %s (and no --key given)\n",
                     config_path.c_str());
        return kExitUsage;
    } else {
        LogWarn("No config at %s, using defaults with command-line keys", config_path.c_str());
    }

    cfg.trusted_keys.insert(cfg.trusted_keys.end(), keys_cli.begin(), keys_cli.end());
    if (max_manifest_cli) {
        cfg.max_manifest_size = *max_manifest_cli;
    }

    ue::TrustedKeyRing keys;
    if (auto r = ue::TrustedKeyRing::LoadFromFiles(cfg.trusted_keys, keys); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitUsage;
    }

    // Devices are opened before the payload is read so a bad path fails fast.
    ue::PartitionDevice target;
    ue::PartitionDevice source;
    if (!verify_only) {
        if (auto r = ue::PartitionDevice::Open(*target_path, ue::PartitionDevice::Mode::kReadWrite,
                                               cfg.target_capacity_bytes, target);
            !r.ok) {
            return Fail(r);
        }
        if (source_path) {
            if (auto r = ue::PartitionDevice::Open(*source_path, ue::PartitionDevice::Mode::kReadOnly,
                                                   std::nullopt, source);
                !r.ok) {
                return Fail(r);
            }
        }
    }

    ue::FileOrStdinReader reader;
    if (auto r = ue::FileOrStdinReader::Open(payload_path, reader); !r.ok) {
        return Fail(r);
    }

    const ue::UpdateEngine engine(cfg, keys);

    std::unique_ptr<ue::VerifiedPayload> verified;
    if (auto r = engine.Verify(reader, expected, /*stage_blob=*/!verify_only, verified); !r.ok) {
        return Fail(r);
    }

    if (verify_only) {
        std::printf("OK %s\n", ue::HexEncode(verified->PayloadHash()).c_str());
        return 0;
    }

    std::unique_ptr<ue::ConsoleProgressSink> console;
    std::unique_ptr<ue::FileProgressSink> file_sink;
    if (!quiet) {
        console = std::make_unique<ue::ConsoleProgressSink>();
    }
    if (progress_file) {
        file_sink = std::make_unique<ue::FileProgressSink>(*progress_file);
    }
    ue::ProgressFanout progress(console.get(), file_sink.get());

    ue::ApplyOptions apply_options;
    apply_options.progress = &progress;
    apply_options.cancel = &ue::g_cancel;

    if (auto r = engine.Apply(*verified, target, source_path ? &source : nullptr, apply_options);
        !r.ok) {
        return Fail(r);
    }

    ue::ClearProgressLine();
    LogInfo("Update applied to %s", target_path->c_str());
    return 0;
}
