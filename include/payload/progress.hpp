#pragma once
#include <cstdint>
#include <string_view>

namespace ue {

// Reported after each install operation completes.
struct ProgressEvent {
    std::string_view operation;
    std::uint64_t ops_done = 0;
    std::uint64_t ops_total = 0;
    std::uint64_t bytes_written = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace ue
