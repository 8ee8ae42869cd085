#include "payload/extent_io.hpp"

#include <algorithm>
#include <string>

namespace ue {

ExtentWriter::ExtentWriter(IBlockDevice& device, std::span<const ByteRange> ranges)
    : device_(&device), ranges_(ranges) {
    for (const auto& r : ranges_) total_ += r.length;
}

Result ExtentWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (in.size() > Remaining()) {
        return Result::FormatError("operation produced more than its " + std::to_string(total_) +
                                   " destination bytes");
    }

    while (!in.empty()) {
        const ByteRange& r = ranges_[index_];
        const auto take = static_cast<size_t>(
            std::min<std::uint64_t>(in.size(), r.length - offset_in_range_));

        if (!r.sparse && take > 0) {
            Result wr = device_->WriteAt(r.offset + offset_in_range_, in.first(take));
            if (!wr.is_ok()) return wr;
        }

        in = in.subspan(take);
        written_ += take;
        offset_in_range_ += take;
        if (offset_in_range_ == r.length) {
            ++index_;
            offset_in_range_ = 0;
        }
    }
    return Result::Ok();
}

Result ExtentWriter::End() const {
    if (written_ != total_) {
        return Result::FormatError("operation produced " + std::to_string(written_) + " of " +
                                   std::to_string(total_) + " destination bytes");
    }
    return Result::Ok();
}

Result ReadExtents(IBlockDevice& device, std::span<const ByteRange> ranges,
                   std::vector<std::uint8_t>& out) {
    std::uint64_t total = 0;
    if (!TotalLength(ranges, total)) {
        return Result::FormatError("source extents overflow");
    }
    out.assign(static_cast<size_t>(total), 0);

    size_t pos = 0;
    for (const auto& r : ranges) {
        if (!r.sparse) {
            Result rr = device.ReadAt(
                r.offset, std::span<std::uint8_t>(out.data() + pos, static_cast<size_t>(r.length)));
            if (!rr.is_ok()) return rr;
        }
        pos += static_cast<size_t>(r.length);
    }
    return Result::Ok();
}

} // namespace ue
