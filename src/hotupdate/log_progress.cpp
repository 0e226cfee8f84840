#include "hotupdate/progress.hpp"
#include "util/logger.hpp"

namespace hotupdate {

void LogProgress::OnProgress(const ProgressEvent& e) {
    const bool final = e.total_bytes > 0 && e.done_bytes >= e.total_bytes;
    if (e.done_bytes < next_ && !final) return;
    next_ = e.done_bytes + min_step_;

    if (e.total_bytes > 0) {
        const int pct = static_cast<int>((e.done_bytes * 100ULL) / e.total_bytes);
        LogInfo("[download %.*s %d%%] %llu/%llu",
                (int)e.version.size(), e.version.data(),
                pct,
                (unsigned long long)e.done_bytes,
                (unsigned long long)e.total_bytes);
    } else {
        LogInfo("[download %.*s] %llu bytes",
                (int)e.version.size(), e.version.data(),
                (unsigned long long)e.done_bytes);
    }
}

} // namespace hotupdate
