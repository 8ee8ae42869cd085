#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace ue {

// Size of the reconstructed data as declared by a bsdiff header
// ("BSDIFF40" or "BSDF2"). Nothing past the header is looked at.
std::expected<std::uint64_t, std::string> BsdiffNewSize(std::span<const std::uint8_t> patch);

// Runs libbspatch over |old_data| and streams the reconstructed bytes into
// |out|. A patch the library rejects is a FormatError; a failed write keeps
// the writer's error.
Result ApplyBsdiffPatch(std::span<const std::uint8_t> old_data,
                        std::span<const std::uint8_t> patch,
                        IWriter& out);

} // namespace ue
