#include "payload/extent_translator.hpp"

#include <string>

namespace ue {

Result ExtentTranslator::Translate(const Extent& extent, ByteRange& out) const {
    std::uint64_t length = 0;
    if (__builtin_mul_overflow(extent.num_blocks, static_cast<std::uint64_t>(block_size_), &length)) {
        return Result::FormatError("extent length overflows");
    }

    if (extent.IsSparse()) {
        out = ByteRange{.offset = 0, .length = length, .sparse = true};
        return Result::Ok();
    }

    std::uint64_t offset = 0;
    std::uint64_t end = 0;
    if (__builtin_mul_overflow(extent.start_block, static_cast<std::uint64_t>(block_size_), &offset) ||
        __builtin_add_overflow(offset, length, &end)) {
        return Result::FormatError("extent end overflows: start_block=" +
                                   std::to_string(extent.start_block));
    }

    if (end > capacity_) {
        return Result::OutOfBounds("extent [" + std::to_string(extent.start_block) + ", +" +
                                   std::to_string(extent.num_blocks) + ") ends at byte " +
                                   std::to_string(end) + " past device capacity " +
                                   std::to_string(capacity_));
    }

    out = ByteRange{.offset = offset, .length = length, .sparse = false};
    return Result::Ok();
}

Result ExtentTranslator::TranslateAll(std::span<const Extent> extents,
                                      std::vector<ByteRange>& out) const {
    std::vector<ByteRange> ranges;
    ranges.reserve(extents.size());
    for (const auto& e : extents) {
        ByteRange r;
        Result res = Translate(e, r);
        if (!res.is_ok()) return res;
        ranges.push_back(r);
    }
    out = std::move(ranges);
    return Result::Ok();
}

bool TotalLength(std::span<const ByteRange> ranges, std::uint64_t& out) {
    std::uint64_t total = 0;
    for (const auto& r : ranges) {
        if (__builtin_add_overflow(total, r.length, &total)) return false;
    }
    out = total;
    return true;
}

} // namespace ue
