#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace warden::safety {

struct ResourceSample {
    std::uint64_t memory_mb = 0;
    double cpu_percent = 0.0;
};

class ResourceProbe {
public:
    virtual ~ResourceProbe() = default;
    virtual ResourceSample sample() = 0;
};

// Resident memory from /proc/self/statm. CPU is the user+system time of this
// process and its reaped children since the previous sample, as a share of
// the wall time in between. The first sample reports 0 % CPU.
class ProcResourceProbe : public ResourceProbe {
public:
    ResourceSample sample() override;

private:
    std::mutex mutex_;
    std::optional<std::chrono::steady_clock::time_point> last_wall_;
    double last_cpu_seconds_ = 0.0;
};

}  // namespace warden::safety
