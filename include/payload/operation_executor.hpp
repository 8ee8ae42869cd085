#pragma once

#include "io/io.hpp"
#include "payload/extent_translator.hpp"
#include "payload/manifest.hpp"
#include "payload/progress.hpp"
#include "util/engine_config.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace ue {

struct ExecutorOptions {
    // Cap on bytes held in memory for one operation (blob data or staged source).
    std::uint64_t max_operation_buffer_bytes = kDefaultMaxOperationBufferBytes;
    // Polled between operations only.
    const std::atomic_bool* cancel = nullptr;
    IProgress* progress = nullptr;
};

// Applies install operations in manifest order to the target device. Reads
// operation data from the verified blob; SOURCE_* operations read the source
// slot, all others read the target. The first failure stops the run; applied
// operations are not rolled back.
class OperationExecutor {
  public:
    OperationExecutor(const Manifest& manifest,
                      const IBlobSource& blob,
                      IBlockDevice& target,
                      IBlockDevice* source,
                      ExecutorOptions options);

    // Translates and size-checks every operation; no device is touched.
    Result Preflight();

    // Preflight, then every operation in order.
    Result Run();

    std::size_t OperationsApplied() const { return applied_; }
    std::uint64_t BytesWritten() const { return bytes_written_; }

  private:
    struct PlannedOp {
        std::vector<ByteRange> src;
        std::vector<ByteRange> dst;
        std::uint64_t src_bytes = 0;
        std::uint64_t dst_bytes = 0;
    };

    Result Plan(std::size_t index, const InstallOperation& op, PlannedOp& out) const;
    Result Apply(std::size_t index, const InstallOperation& op, const PlannedOp& plan);

    Result LoadData(std::size_t index, const InstallOperation& op, std::vector<std::uint8_t>& out);

    Result ApplyReplace(const PlannedOp& plan, std::span<const std::uint8_t> data);
    Result ApplyReplaceCompressed(const PlannedOp& plan, std::span<const std::uint8_t> data,
                                  bool xz);
    Result ApplyZero(const PlannedOp& plan);
    Result ApplyDiscard(const PlannedOp& plan);
    Result ApplyCopy(const PlannedOp& plan, IBlockDevice& from);
    Result ApplyBsdiff(const InstallOperation& op, const PlannedOp& plan, IBlockDevice& from,
                       std::span<const std::uint8_t> patch);

    const Manifest* manifest_;
    const IBlobSource* blob_;
    IBlockDevice* target_;
    IBlockDevice* source_;
    ExecutorOptions options_;

    std::vector<PlannedOp> plans_;
    bool planned_ = false;
    std::size_t applied_ = 0;
    std::uint64_t bytes_written_ = 0;
};

} // namespace ue
