#pragma once
#include <cstdint>
#include <string_view>

namespace hotpush {

struct ProgressEvent {
    std::string_view file;
    std::uint64_t files_done = 0;
    std::uint64_t files_total = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace hotpush
