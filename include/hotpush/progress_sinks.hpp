#pragma once

#include "hotpush/progress.hpp"

namespace hotpush {

// Renders "[file] done/total" on a single stderr line.
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace hotpush
