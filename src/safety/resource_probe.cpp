#include "safety/resource_probe.hpp"

#include <fstream>
#include <sys/resource.h>
#include <unistd.h>

namespace warden::safety {

namespace {

double to_seconds(const timeval& tv) {
    return static_cast<double>(tv.tv_sec) + static_cast<double>(tv.tv_usec) / 1e6;
}

double cpu_seconds(const int who) {
    rusage usage{};
    if (getrusage(who, &usage) != 0) {
        return 0.0;
    }
    return to_seconds(usage.ru_utime) + to_seconds(usage.ru_stime);
}

std::uint64_t resident_memory_mb() {
    std::ifstream statm("/proc/self/statm");
    std::uint64_t total_pages = 0;
    std::uint64_t resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) {
        return 0;
    }
    const long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        return 0;
    }
    return resident_pages * static_cast<std::uint64_t>(page_size) / (1024 * 1024);
}

}  // namespace

ResourceSample ProcResourceProbe::sample() {
    ResourceSample result;
    result.memory_mb = resident_memory_mb();

    const auto now = std::chrono::steady_clock::now();
    const double cpu = cpu_seconds(RUSAGE_SELF) + cpu_seconds(RUSAGE_CHILDREN);

    std::lock_guard<std::mutex> lock(mutex_);
    if (last_wall_.has_value()) {
        const double wall =
            std::chrono::duration<double>(now - last_wall_.value()).count();
        if (wall > 0.0) {
            result.cpu_percent = (cpu - last_cpu_seconds_) / wall * 100.0;
        }
    }
    if (result.cpu_percent < 0.0) {
        result.cpu_percent = 0.0;
    }
    last_wall_ = now;
    last_cpu_seconds_ = cpu;
    return result;
}

}  // namespace warden::safety
