#include "hotpush/progress_sinks.hpp"

#include <atomic>
#include <cstdio>

namespace hotpush {

namespace {
std::atomic_bool g_progress_line_active{false};
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    int pct = 0;
    if (e.files_total > 0) {
        pct = static_cast<int>((e.files_done * 100ULL) / e.files_total);
        if (pct > 100)
            pct = 100;
    }

    std::fprintf(stderr,
                 "\r[%3d%%] %llu/%llu %.*s\033[K",
                 pct,
                 (unsigned long long)e.files_done,
                 (unsigned long long)e.files_total,
                 (int)e.file.size(),
                 e.file.data());
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.files_total > 0 && e.files_done >= e.files_total) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace hotpush
