#pragma once
#include <chrono>
#include <mutex>
#include <string>

#include "model/Snapshot.hpp"

namespace latmon {

// Own-process uptime, resident memory and CPU%.
// CPU% is measured between consecutive sample() calls (since process
// start for the first one), 100% = one core.
class ResourceProbe {
public:
    explicit ResourceProbe(std::string proc_self = "/proc/self");

    ResourceUsage sample();

private:
    uint64_t resident_mb() const;

    std::string proc_self_;
    std::chrono::steady_clock::time_point started_;

    std::mutex mtx_;
    std::chrono::steady_clock::time_point last_wall_;
    double last_cpu_sec_{0.0};
};

} // namespace latmon
