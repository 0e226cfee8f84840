#pragma once
#include <cstdint>
#include <string_view>

namespace hotupdate {

struct ProgressEvent {
    std::string_view version;
    std::uint64_t done_bytes = 0;
    std::uint64_t total_bytes = 0;  // 0 => unknown
};

class IProgress {
public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

// Logs at most once per `min_step_bytes`, plus the final event.
class LogProgress final : public IProgress {
public:
    explicit LogProgress(std::uint64_t min_step_bytes = 1024 * 1024ULL)
        : min_step_(min_step_bytes) {}

    void OnProgress(const ProgressEvent& e) override;

private:
    std::uint64_t min_step_ = 0;
    std::uint64_t next_ = 0;
};

} // namespace hotupdate
